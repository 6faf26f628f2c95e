#pragma once
#include <string>
#include <vector>

namespace ntm {
namespace formats {

// Row writer with spreadsheet-style minimal quoting: a field is quoted only
// when it contains the delimiter, a double quote, CR or LF; embedded quotes
// are doubled. A row made of one empty field is written as "" so it stays
// distinguishable from a blank row.
class DelimitedWriter {
public:
    DelimitedWriter(char delimiter, std::string lineTerminator);

    void WriteRow(const std::vector<std::string>& fields);
    void WriteBlankRow() { m_Out += m_LineTerminator; }
    void WriteRaw(const std::string& text) { m_Out += text; }

    const std::string& Str() const { return m_Out; }

private:
    std::string Quote(const std::string& field) const;

    char m_Delimiter;
    std::string m_LineTerminator;
    std::string m_Out;
};

} // namespace formats
} // namespace ntm
