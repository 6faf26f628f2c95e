#include "formats/DelimitedWriter.h"

namespace ntm {
namespace formats {

DelimitedWriter::DelimitedWriter(char delimiter, std::string lineTerminator)
    : m_Delimiter(delimiter), m_LineTerminator(std::move(lineTerminator)) {}

std::string DelimitedWriter::Quote(const std::string& field) const
{
    bool needsQuotes = field.find_first_of(std::string{m_Delimiter, '"', '\r', '\n'}) != std::string::npos;
    if (!needsQuotes) return field;
    std::string out; out.reserve(field.size() + 2);
    out.push_back('"');
    for (char c : field) {
        if (c == '"') out.push_back('"');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

void DelimitedWriter::WriteRow(const std::vector<std::string>& fields)
{
    if (fields.size() == 1 && fields[0].empty()) {
        m_Out += "\"\"";
    } else {
        for (size_t i = 0; i < fields.size(); ++i) {
            if (i) m_Out.push_back(m_Delimiter);
            m_Out += Quote(fields[i]);
        }
    }
    m_Out += m_LineTerminator;
}

} // namespace formats
} // namespace ntm
