#ifndef CSV_HPP
#define CSV_HPP

#include <cstddef>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

// Split one CSV line into fields using RFC 4180 quoting ("" is a literal quote inside a quoted field).
// Quotes inside an unquoted field are kept literally. Returns false when a quoted field is not closed;
// the unterminated field then holds the rest of the line.
bool splitCsvLine(const std::string& line, std::vector<std::string>& fields);

// Read one record, joining physical lines while a quoted field is still open so embedded line breaks
// survive. `lineNumber` advances by the lines consumed. Returns false once the input is exhausted;
// `terminated` is false when the input ended inside a quoted field.
bool readCsvRecord(std::istream& in, std::vector<std::string>& fields, std::size_t& lineNumber, bool& terminated);

// Quote a field when it contains a delimiter, quote or line break.
std::string csvEscape(const std::string& field);

// Write one escaped row terminated by '\n'.
void writeCsvRow(std::ostream& out, const std::vector<std::string>& fields);

// Strip ASCII whitespace from both ends.
std::string trimWhitespace(const std::string& value);

std::string toLowerAscii(std::string value);

#endif
