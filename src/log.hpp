#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace slog {
enum class Severity { Debug, Info, Warning, Error, Fatal };

void init(Severity severity = Severity::Info);
void setLogLevel(Severity severity);
Severity getLogLevel();

std::string_view toString(Severity severity);
std::optional<Severity> parseSeverity(std::string_view str);

namespace detail {
    // We use a custom string buf, so we can preallocate and clear to reuse the same buffer
    class StringStreamBuf : public std::streambuf {
    public:
        StringStreamBuf(size_t initialSize);

        std::streamsize xsputn(const char* s, std::streamsize n) override;
        int_type overflow(int_type ch) override;

        void clear();
        std::string& string();

    private:
        std::string str_;
    };

    void replaceDateTime(char* buffer, size_t size, const char* format);

    // Writes the whole line with a single write(2)
    void write(const std::string& line);

    // Every request runs on its own thread, so this has to be thread-safe. The formatting
    // happens in a thread_local buffer and only the final write is serialized.
    template <typename... Args>
    void log(Severity severity, std::string_view severityStr, Args&&... args)
    {
        if (static_cast<int>(severity) < static_cast<int>(getLogLevel())) {
            return;
        }
        thread_local StringStreamBuf buf(1024);
        thread_local std::ostream os(&buf);
        buf.clear();
        static constexpr std::string_view dtDummy = "YYYY-mm-dd HH:MM:SS";
        (os << "[" << dtDummy << "] [" << severityStr << "] " << ... << args) << "\n";
        replaceDateTime(buf.string().data() + 1, dtDummy.size() + 1, "%F %T");
        //  Restore the char that was overwritten with null by strftime (so silly)
        buf.string().data()[1 + dtDummy.size()] = ']';
        write(buf.string());
    }
}

template <typename... Args>
void log(Severity severity, Args&&... args)
{
    detail::log(severity, toString(severity), std::forward<Args>(args)...);
}

template <typename... Args>
void debug(Args&&... args)
{
    detail::log(Severity::Debug, "DEBUG", std::forward<Args>(args)...);
}

template <typename... Args>
void info(Args&&... args)
{
    detail::log(Severity::Info, "INFO", std::forward<Args>(args)...);
}

template <typename... Args>
void warning(Args&&... args)
{
    detail::log(Severity::Warning, "WARNING", std::forward<Args>(args)...);
}

template <typename... Args>
void error(Args&&... args)
{
    detail::log(Severity::Error, "ERROR", std::forward<Args>(args)...);
}

template <typename... Args>
void fatal(Args&&... args)
{
    detail::log(Severity::Fatal, "FATAL", std::forward<Args>(args)...);
}
}
