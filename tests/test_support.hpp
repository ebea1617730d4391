#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <system_error>

namespace reldb::test {

// Fresh directory under the system temp path, removed on destruction.
class TempDirectory final {
public:
    explicit TempDirectory(const std::string& prefix)
        : path_{std::filesystem::temp_directory_path()
                / (prefix + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()))}
    {
        (void)std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }

    ~TempDirectory()
    {
        std::error_code ec;
        (void)std::filesystem::remove_all(path_, ec);
    }

    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_{};
};

// The code carried by the std::system_error the operation throws, or an empty
// code when it does not throw.
template <typename Operation>
std::error_code error_code_of(Operation&& operation)
{
    try {
        operation();
    } catch (const std::system_error& error) {
        return error.code();
    }
    return {};
}

}  // namespace reldb::test
