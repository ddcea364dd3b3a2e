#pragma once

#include <atomic>
#include <cstddef>
#include <string>
#include <string_view>

namespace processing
{

// Runtime switches for extraction tracing. Messages go to the plog instance
// kLogInstance so they can be routed to their own file.
class Diagnostics
{
public:
    static constexpr int kLogInstance = 1;

    static void SetVerbose(bool enabled) noexcept;
    [[nodiscard]] static bool IsVerbose() noexcept;

    static void SetMaxPreview(std::size_t bytes) noexcept;
    [[nodiscard]] static std::size_t MaxPreview() noexcept;

    // Printable, length-limited copy of a line for log output
    [[nodiscard]] static std::string Preview(std::string_view text);

    // "<source>:<line>"
    [[nodiscard]] static std::string Location(std::string_view source, std::size_t line);

private:
    static void sanitize(std::string& text);
    static std::atomic<bool> verbose_;
    static std::atomic<std::size_t> max_preview_;
};

} // namespace processing
