#include "tabula/collab/json_encoding.hpp"

#include <chrono>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <type_traits>
#include <variant>

namespace tabula::collab {

void append_json_string(std::string& out, std::string_view text)
{
    out.push_back('"');
    for (unsigned char ch : text) {
        switch (ch) {
        case '"':
            out.append("\\\"");
            break;
        case '\\':
            out.append("\\\\");
            break;
        case '\b':
            out.append("\\b");
            break;
        case '\f':
            out.append("\\f");
            break;
        case '\n':
            out.append("\\n");
            break;
        case '\r':
            out.append("\\r");
            break;
        case '\t':
            out.append("\\t");
            break;
        default:
            if (ch < 0x20U) {
                constexpr char kHex[] = "0123456789ABCDEF";
                out.append("\\u00");
                out.push_back(kHex[(ch >> 4U) & 0x0F]);
                out.push_back(kHex[ch & 0x0F]);
            } else {
                out.push_back(static_cast<char>(ch));
            }
            break;
        }
    }
    out.push_back('"');
}

void append_json_field_value(std::string& out, const FieldValue& value)
{
    std::visit(
        [&out](const auto& cell) {
            using T = std::decay_t<decltype(cell)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                out.append("null");
            } else if constexpr (std::is_same_v<T, bool>) {
                out.append(cell ? "true" : "false");
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                out.append(std::to_string(cell));
            } else if constexpr (std::is_same_v<T, double>) {
                if (!std::isfinite(cell)) {
                    out.append("null");
                    return;
                }
                std::ostringstream stream;
                stream << std::setprecision(17) << cell;
                out.append(stream.str());
            } else {
                append_json_string(out, cell);
            }
        },
        value);
}

void append_json_field_map(std::string& out, const FieldMap& fields)
{
    out.push_back('{');
    bool first = true;
    for (const auto& [name, value] : fields) {
        if (!first) {
            out.push_back(',');
        }
        first = false;
        append_json_string(out, name);
        out.push_back(':');
        append_json_field_value(out, value);
    }
    out.push_back('}');
}

std::string format_timestamp_iso(Timestamp tp)
{
    if (tp.time_since_epoch().count() == 0) {
        return {};
    }

    const auto whole_seconds = std::chrono::floor<std::chrono::seconds>(tp);
    const auto time_value = Clock::to_time_t(whole_seconds);
    std::tm buffer{};
#if defined(_WIN32)
    gmtime_s(&buffer, &time_value);
#else
    gmtime_r(&time_value, &buffer);
#endif

    std::ostringstream stream;
    stream << std::put_time(&buffer, "%Y-%m-%dT%H:%M:%S");
    const auto fractional = tp - whole_seconds;
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(fractional).count();
    stream << '.' << std::setw(6) << std::setfill('0') << micros << 'Z';
    return stream.str();
}

}  // namespace tabula::collab
