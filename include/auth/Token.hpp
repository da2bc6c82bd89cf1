#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace fa::auth {

// The device credential: either inline ("abc123") or a reference to a raw file
// ("file:/var/lib/fieldagent/auth"). A referenced file that does not exist yet
// means the device still awaits approval.
class Token {
public:
    explicit Token(std::string source);

    [[nodiscard]] bool isFileReference() const noexcept { return file_.has_value(); }
    [[nodiscard]] const std::optional<std::filesystem::path>& file() const noexcept { return file_; }

    // Empty when unset or when the referenced file is missing/unreadable.
    [[nodiscard]] std::string value() const;

    [[nodiscard]] bool present() const { return !value().empty(); }

    // Writes the credential to the referenced file (creating parent directories).
    // Throws when the token is inline or the write fails.
    void persist(const std::string& token);

private:
    static constexpr std::string_view kFilePrefix = "file:";

    std::string inline_;
    std::optional<std::filesystem::path> file_;
    mutable std::mutex mutex_;
};

}
