#include "input/RecordParser.hpp"

#include <cctype>
#include <sstream>

#include "core/Errors.hpp"
#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"

namespace OpsTriage
{
    namespace Input
    {
        using namespace core;
        using namespace Utils;

        namespace
        {
            bool isSkippable(std::string_view line)
            {
                const auto t = trim(line);
                return t.empty() || t.front() == '#';
            }

            int hexValue(char c) noexcept
            {
                if (c >= '0' && c <= '9') return c - '0';
                if (c >= 'a' && c <= 'f') return c - 'a' + 10;
                if (c >= 'A' && c <= 'F') return c - 'A' + 10;
                return -1;
            }

            // Encode a BMP code point as UTF-8.
            void appendUtf8(std::string &out, unsigned cp)
            {
                if (cp < 0x80)
                {
                    out.push_back(static_cast<char>(cp));
                }
                else if (cp < 0x800)
                {
                    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
                    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
                }
                else
                {
                    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
                    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
                }
            }

            void skipSpace(std::string_view json, std::size_t &pos) noexcept
            {
                while (pos < json.size() && std::isspace(static_cast<unsigned char>(json[pos]))) ++pos;
            }

            // pos sits on the opening quote; on success it is left past the closing one.
            bool readString(std::string_view json, std::size_t &pos, std::string &out)
            {
                ++pos;
                while (pos < json.size())
                {
                    const char c = json[pos++];
                    if (c == '"') return true;
                    if (c != '\\')
                    {
                        out.push_back(c);
                        continue;
                    }
                    if (pos >= json.size()) return false;

                    const char esc = json[pos++];
                    switch (esc)
                    {
                    case 'n': out.push_back('\n'); break;
                    case 't': out.push_back('\t'); break;
                    case 'r': out.push_back('\r'); break;
                    case 'b': out.push_back('\b'); break;
                    case 'f': out.push_back('\f'); break;
                    case 'u':
                    {
                        if (pos + 4 > json.size()) return false;
                        unsigned cp = 0;
                        for (std::size_t i = 0; i < 4; ++i)
                        {
                            const int h = hexValue(json[pos + i]);
                            if (h < 0) return false;
                            cp = cp * 16 + static_cast<unsigned>(h);
                        }
                        pos += 4;
                        appendUtf8(out, cp);
                        break;
                    }
                    default: out.push_back(esc); break;   // \" \\ \/
                    }
                }
                return false;
            }

            // pos sits on '{' or '['; on success it is left past the matching close.
            bool skipNested(std::string_view json, std::size_t &pos)
            {
                int depth = 0;
                while (pos < json.size())
                {
                    const char c = json[pos];
                    if (c == '"')
                    {
                        std::string ignored;
                        if (!readString(json, pos, ignored)) return false;
                        continue;
                    }
                    ++pos;
                    if (c == '{' || c == '[')
                        ++depth;
                    else if ((c == '}' || c == ']') && --depth == 0)
                        return true;
                }
                return false;
            }
        } // anonymous namespace

        std::optional<std::string> RecordParser::extractField(std::string_view json, std::string_view key)
        {
            std::size_t pos = 0;
            skipSpace(json, pos);
            if (pos < json.size() && json[pos] == '{')
                ++pos;

            // Walk top-level "key": value pairs; string contents never match a key.
            while (true)
            {
                skipSpace(json, pos);
                if (pos >= json.size() || json[pos] != '"') return std::nullopt;

                std::string name;
                if (!readString(json, pos, name)) return std::nullopt;

                skipSpace(json, pos);
                if (pos >= json.size() || json[pos] != ':') return std::nullopt;
                ++pos;
                skipSpace(json, pos);
                if (pos >= json.size()) return std::nullopt;

                const bool wanted = (name == key);

                if (json[pos] == '"')
                {
                    std::string value;
                    if (!readString(json, pos, value)) return std::nullopt;
                    if (wanted) return value;
                }
                else if (json[pos] == '{' || json[pos] == '[')
                {
                    const std::size_t begin = pos;
                    if (!skipNested(json, pos)) return std::nullopt;
                    if (wanted) return std::string(json.substr(begin, pos - begin));
                }
                else
                {
                    std::size_t end = pos;
                    while (end < json.size() && json[end] != ',' && json[end] != '}') ++end;
                    const std::string_view raw = trim(json.substr(pos, end - pos));
                    pos = end;
                    if (wanted)
                    {
                        if (raw.empty() || raw == "null") return std::nullopt;
                        return std::string(raw);
                    }
                }

                skipSpace(json, pos);
                if (pos >= json.size() || json[pos] != ',') return std::nullopt;
                ++pos;
            }
        }

        std::string_view RecordParser::objectBody(std::string_view rawLine)
        {
            const auto t = trim(rawLine);
            if (t.size() < 2 || t.front() != '{' || t.back() != '}')
            {
                throw MalformedInputError("record", "expected a JSON object per line");
            }
            return t;
        }

        std::string RecordParser::requireField(std::string_view json,
                                               std::string_view key,
                                               std::string_view fallbackKey,
                                               std::string_view recordId)
        {
            auto value = extractField(json, key);
            if (!value && !fallbackKey.empty())
                value = extractField(json, fallbackKey);

            if (!value || trim(*value).empty())
            {
                std::string what = "missing required field '" + std::string(key) + "'";
                if (!recordId.empty())
                    what += " on record '" + std::string(recordId) + "'";
                throw MalformedInputError(std::string(key), std::string(recordId), what);
            }
            return std::string(trim(*value));
        }

        AlertRecord RecordParser::parseAlertLine(std::string_view rawLine) const
        {
            const auto json = objectBody(rawLine);

            std::string id = requireField(json, "alert_id", "id", "");
            std::string title = requireField(json, "title", "", id);
            std::string host = requireField(json, "host", "", id);
            const std::string severityText = requireField(json, "severity", "", id);
            std::string timestamp = requireField(json, "timestamp", "", id);

            const auto severity = parseSeverity(severityText);
            if (!severity)
            {
                throw MalformedInputError("severity", id,
                                          "unknown severity '" + severityText + "' on record '" + id + "'");
            }

            return AlertRecord(std::move(id),
                               std::move(title),
                               std::move(host),
                               *severity,
                               EventTime::fromText(std::move(timestamp)),
                               extractField(json, "description"),
                               extractField(json, "source"));
        }

        MetricPoint RecordParser::parseMetricLine(std::string_view rawLine) const
        {
            const auto json = objectBody(rawLine);

            std::string host = requireField(json, "host", "", "");
            std::string name = requireField(json, "metric_name", "metric", "");
            const std::string valueText = requireField(json, "value", "", "");

            const auto value = parseFloat<double>(valueText);
            if (!value)
            {
                throw MalformedInputError("value", "non-numeric metric value '" + valueText + "' for " +
                                                       host + "/" + name);
            }

            return MetricPoint(std::move(host),
                               std::move(name),
                               *value,
                               EventTime::fromText(extractField(json, "timestamp").value_or("")));
        }

        std::vector<AlertRecord> RecordParser::readAlerts(FileReader &reader) const
        {
            std::vector<AlertRecord> alerts;
            while (auto line = reader.nextLine())
            {
                if (isSkippable(*line))
                    continue;

                try
                {
                    alerts.push_back(parseAlertLine(*line));
                }
                catch (const MalformedInputError &e)
                {
                    std::ostringstream oss;
                    oss << reader.filePath() << ":" << reader.lineNumber() << ": " << e.what();
                    throw MalformedInputError(e.field(), e.recordId(), oss.str());
                }
            }
            return alerts;
        }

        std::vector<MetricPoint> RecordParser::readMetrics(FileReader &reader, std::size_t *skippedOut) const
        {
            std::vector<MetricPoint> metrics;
            std::size_t skipped = 0;

            while (auto line = reader.nextLine())
            {
                if (isSkippable(*line))
                    continue;

                try
                {
                    metrics.push_back(parseMetricLine(*line));
                }
                catch (const MalformedInputError &e)
                {
                    ++skipped;
                    std::ostringstream oss;
                    oss << reader.filePath() << ":" << reader.lineNumber() << ": skipping metric: " << e.what();
                    getLogger().log(LogLevel::ERROR, "Input", oss.str());
                }
            }

            if (skippedOut)
                *skippedOut = skipped;
            return metrics;
        }

    } // namespace Input
} // namespace OpsTriage
