#pragma once

#include <filesystem>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace filegate::server
{

    // Password check consumed by the login route.
    class CredentialVerifier
    {
    public:
        virtual ~CredentialVerifier() = default;

        virtual bool verify(const std::string &username, const std::string &password) const = 0;

        // Failed logins are only tracked for names this returns true for.
        virtual bool contains(const std::string &username) const = 0;
    };

    // JSON-file registry of accounts with libsodium password hashes.
    class UserStore : public CredentialVerifier
    {
    public:
        explicit UserStore(std::filesystem::path database_path);

        bool verify(const std::string &username, const std::string &password) const override;

        bool create_account(const std::string &username, const std::string &password, std::string &message);
        bool delete_account(const std::string &username);

        bool contains(const std::string &username) const override;
        std::vector<std::string> usernames() const;

    private:
        void load_locked() const;
        void persist_locked() const;

        std::filesystem::path database_path_;

        mutable std::mutex mutex_;
        mutable bool loaded_{false};
        mutable std::unordered_map<std::string, std::string> users_;
    };

    // Rejects names that cannot double as a single directory name.
    bool is_valid_username(const std::string &username);

} // namespace filegate::server
