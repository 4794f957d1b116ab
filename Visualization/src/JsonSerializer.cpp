#include <Visualization/JsonSerializer.hpp>
#include <iomanip>
#include <sstream>

namespace watchannotator::viz
{
    std::string JsonSerializer::quote(std::string_view text)
    {
        std::ostringstream oss;
        oss << '"';
        for (char c : text)
        {
            switch (c)
            {
            case '"':
                oss << "\\\"";
                break;
            case '\\':
                oss << "\\\\";
                break;
            case '\n':
                oss << "\\n";
                break;
            case '\r':
                oss << "\\r";
                break;
            case '\t':
                oss << "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20)
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c) << std::dec;
                else
                    oss << c;
            }
        }
        oss << '"';
        return oss.str();
    }

    std::string JsonSerializer::toJson(const WindowView &v)
    {
        std::ostringstream oss;
        oss << "{"
            << "\"kind\":\"window\","
            << "\"mode\":" << quote(toString(v.mode)) << ","
            << "\"start\":" << v.start_index << ","
            << "\"length\":" << v.length << ","
            << "\"size\":" << v.size << ","
            << "\"rows\":[" << v.first_row << "," << v.last_row << "],"
            << "\"from\":" << quote(v.first_stamp) << ","
            << "\"to\":" << quote(v.last_stamp) << ","
            << "\"invalid\":" << v.invalid_count
            << "}";
        return oss.str();
    }

    std::string JsonSerializer::toJson(const ProgressUpdate &p)
    {
        std::ostringstream oss;
        oss << "{"
            << "\"kind\":\"progress\","
            << "\"task\":" << quote(toString(p.task)) << ","
            << "\"msg\":" << quote(p.message)
            << "}";
        return oss.str();
    }

    std::string JsonSerializer::toJson(const TaskCompleted &c)
    {
        std::ostringstream oss;
        oss << "{"
            << "\"kind\":\"done\","
            << "\"task\":" << quote(toString(c.task)) << ","
            << "\"success\":" << (c.success ? "true" : "false") << ","
            << "\"error\":" << quote(c.error)
            << "}";
        return oss.str();
    }

    std::string JsonSerializer::toJson(const SystemEvent &e)
    {
        std::ostringstream oss;
        oss << "{"
            << "\"kind\":\"event\","
            << "\"type\":" << quote(toString(e.type)) << ","
            << "\"desc\":" << quote(e.description)
            << "}";
        return oss.str();
    }
} // namespace watchannotator::viz
