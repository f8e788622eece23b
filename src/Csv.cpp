#include "Csv.hpp"

#include <algorithm>
#include <cctype>

bool splitCsvLine(const std::string& line, std::vector<std::string>& fields) {
    fields.clear();

    std::string::size_type end = line.size();
    while (end > 0 && (line[end - 1] == '\n' || line[end - 1] == '\r')) {
        --end;
    }

    std::string field;
    bool inQuotes = false;
    bool atFieldStart = true;

    for (std::string::size_type i = 0; i < end; ++i) {
        const char ch = line[i];

        if (inQuotes) {
            if (ch != '"') {
                field.push_back(ch);
            } else if (i + 1 < end && line[i + 1] == '"') {
                field.push_back('"');
                ++i;
            } else {
                inQuotes = false;
            }
            continue;
        }

        if (ch == ',') {
            fields.push_back(std::move(field));
            field.clear();
            atFieldStart = true;
            continue;
        }

        if (ch == '"' && atFieldStart) {
            inQuotes = true;
            atFieldStart = false;
            continue;
        }

        field.push_back(ch);
        atFieldStart = false;
    }

    fields.push_back(std::move(field));
    return !inQuotes;
}

bool readCsvRecord(std::istream& in, std::vector<std::string>& fields, std::size_t& lineNumber, bool& terminated) {
    fields.clear();
    terminated = true;

    std::string record;
    if (!std::getline(in, record)) {
        return false;
    }
    ++lineNumber;

    std::string line;
    while (!(terminated = splitCsvLine(record, fields)) && std::getline(in, line)) {
        ++lineNumber;
        record.push_back('\n');
        record += line;
    }
    return true;
}

std::string csvEscape(const std::string& field) {
    bool needsQuotes = false;
    for (char ch : field) {
        if (ch == '"' || ch == ',' || ch == '\n' || ch == '\r') {
            needsQuotes = true;
            break;
        }
    }
    if (!needsQuotes) {
        return field;
    }

    std::string out;
    out.reserve(field.size() + 2);
    out.push_back('"');
    for (char ch : field) {
        if (ch == '"') {
            out.push_back('"');
        }
        out.push_back(ch);
    }
    out.push_back('"');
    return out;
}

void writeCsvRow(std::ostream& out, const std::vector<std::string>& fields) {
    for (std::size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) {
            out << ',';
        }
        out << csvEscape(fields[i]);
    }
    out << '\n';
}

std::string trimWhitespace(const std::string& value) {
    const auto isSpace = [](unsigned char ch) { return std::isspace(ch) != 0; };
    auto first = std::find_if_not(value.begin(), value.end(), isSpace);
    auto last = std::find_if_not(value.rbegin(), value.rend(), isSpace).base();
    if (first >= last) {
        return {};
    }
    return std::string(first, last);
}

std::string toLowerAscii(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}
