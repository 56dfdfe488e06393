//============================================================
// Diagnostics.cpp
//============================================================
#include "Diagnostics.hpp"

#include <iostream>
#include <utility>

namespace
{
    diag::Sink& activeSink()
    {
        static diag::Sink sink;
        return sink;
    }

    DiagRecord makeRecord(DiagSeverity severity, std::string message, std::vector<std::string> details, DiagCode code)
    {
        DiagRecord r = {};
        r.severity   = severity;
        r.code       = code;
        r.message    = std::move(message);
        r.details    = std::move(details);
        return r;
    }
} // namespace

namespace diag
{
    void setSink(Sink sink)
    {
        activeSink() = std::move(sink);
    }

    void resetSink()
    {
        activeSink() = nullptr;
    }

    void emit(const DiagRecord& record)
    {
        Sink& sink = activeSink();
        if (sink)
        {
            sink(record);
            return;
        }

        writeRecord(std::cerr, record);
    }

    void log(std::string message, std::vector<std::string> details, DiagCode code)
    {
        emit(makeRecord(DiagSeverity::Info, std::move(message), std::move(details), code));
    }

    void warn(std::string message, std::vector<std::string> details, DiagCode code)
    {
        emit(makeRecord(DiagSeverity::Warning, std::move(message), std::move(details), code));
    }

    void error(std::string message, std::vector<std::string> details, DiagCode code)
    {
        emit(makeRecord(DiagSeverity::Error, std::move(message), std::move(details), code));
    }

    const char* severityTag(DiagSeverity severity) noexcept
    {
        switch (severity)
        {
            case DiagSeverity::Info:
                return "INFO";
            case DiagSeverity::Warning:
                return "WARNING";
            case DiagSeverity::Error:
                return "ERROR";
        }
        return "INFO";
    }

    void writeRecord(std::ostream& os, const DiagRecord& record)
    {
        os << "[" << severityTag(record.severity) << "]";
        if (record.code != DiagCode::None)
            os << "(" << static_cast<uint16_t>(record.code) << ")";
        os << ": " << record.message << "\n";

        for (const std::string& d : record.details)
            os << "  > " << d << "\n";
    }

} // namespace diag
