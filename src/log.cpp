#include "log.hpp"

#include <array>
#include <atomic>
#include <cassert>
#include <ctime>
#include <mutex>

#include <unistd.h>

#include "string.hpp"

namespace slog {
namespace {
    std::atomic<Severity>& currentLogLevel()
    {
        static std::atomic<Severity> severity { Severity::Info };
        return severity;
    }

    std::mutex& writeMutex()
    {
        static std::mutex mutex;
        return mutex;
    }
}

std::string_view toString(Severity severity)
{
    static constexpr std::array strings { "DEBUG", "INFO", "WARNING", "ERROR", "FATAL" };
    const auto idx = static_cast<int>(severity);
    if (idx < 0 || static_cast<size_t>(idx) >= strings.size()) {
        return "INVALID";
    }
    return strings[idx];
}

std::optional<Severity> parseSeverity(std::string_view str)
{
    for (const auto severity : { Severity::Debug, Severity::Info, Severity::Warning,
             Severity::Error, Severity::Fatal }) {
        if (ciEqual(str, toString(severity))) {
            return severity;
        }
    }
    return std::nullopt;
}

void setLogLevel(Severity severity)
{
    currentLogLevel().store(severity);
}

Severity getLogLevel()
{
    return currentLogLevel().load(std::memory_order_relaxed);
}

void init(Severity severity)
{
    setLogLevel(severity);
}

namespace detail {
    StringStreamBuf::StringStreamBuf(size_t initialSize)
        : str_(initialSize, 0)
    {
        str_.resize(0);
    }

    std::streamsize StringStreamBuf::xsputn(const char* s, std::streamsize n)
    {
        str_.append(s, n);
        return n;
    }

    StringStreamBuf::int_type StringStreamBuf::overflow(int_type ch)
    {
        if (ch != traits_type::eof()) {
            str_.push_back(static_cast<char>(ch));
        }
        return ch;
    }

    void StringStreamBuf::clear()
    {
        str_.clear();
    }

    std::string& StringStreamBuf::string()
    {
        return str_;
    }

    void replaceDateTime(char* buffer, size_t size, const char* format)
    {
        const auto t = std::time(nullptr);
        std::tm tm;
        ::localtime_r(&t, &tm);
        [[maybe_unused]] const auto n = std::strftime(buffer, size, format, &tm);
        assert(n > 0);
    }

    void write(const std::string& line)
    {
        std::lock_guard lock(writeMutex());
        size_t offset = 0;
        while (offset < line.size()) {
            const auto n = ::write(STDOUT_FILENO, line.data() + offset, line.size() - offset);
            if (n <= 0) {
                // Nowhere left to report this
                return;
            }
            offset += static_cast<size_t>(n);
        }
    }
}
}
