#include "BatchRenamerLogic.h"

#include <wx/string.h>
#include <wx/tokenzr.h> // For splitting comma-separated extension string

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <set>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

// Case-insensitive string comparison
bool BatchRenamerLogic::iequals(const std::string &a, const std::string &b) {
  if (a.length() != b.length()) {
    return false;
  }
  return std::equal(a.begin(), a.end(), b.begin(), b.end(),
                    [](char char_a, char char_b) {
                      return std::tolower(static_cast<unsigned char>(char_a)) ==
                             std::tolower(static_cast<unsigned char>(char_b));
                    });
}

// Converts string to lowercase
std::string ToLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

// Strips leading and trailing whitespace
std::string BatchRenamerLogic::Trim(const std::string &s) {
  const char *ws = " \t\r\n\f\v";
  const std::size_t first = s.find_first_not_of(ws);
  if (first == std::string::npos) {
    return "";
  }
  const std::size_t last = s.find_last_not_of(ws);
  return s.substr(first, last - first + 1);
}

// Lower-cases an extension and guarantees a leading dot ("PDF" -> ".pdf")
std::string BatchRenamerLogic::NormaliseExtension(const std::string &extension) {
  std::string ext = ToLower(Trim(extension));
  if (!ext.empty() && ext[0] != '.') {
    ext = "." + ext;
  }
  return ext;
}

// Splits a comma-separated extension list, dropping blanks and duplicates
std::vector<std::string>
BatchRenamerLogic::ParseExtensionList(const std::string &commaSeparated) {
  std::vector<std::string> extensions;
  wxStringTokenizer tokenizer(wxString::FromUTF8(commaSeparated), ",");
  while (tokenizer.HasMoreTokens()) {
    std::string ext =
        NormaliseExtension(tokenizer.GetNextToken().Trim().Trim(false).ToStdString());
    if (!ext.empty() &&
        std::find(extensions.begin(), extensions.end(), ext) == extensions.end()) {
      extensions.push_back(ext);
    }
  }
  return extensions;
}

std::string BatchRenamerLogic::JoinList(const std::vector<std::string> &items,
                                        const std::string &separator) {
  std::string joined;
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (i > 0) {
      joined += separator;
    }
    joined += items[i];
  }
  return joined;
}

// Human ordering: embedded digit runs compare by numeric value, so "file2"
// precedes "file10"
bool BatchRenamerLogic::NaturalLess(const std::string &a, const std::string &b) {
  const int cmp =
      wxCmpNaturalGeneric(wxString::FromUTF8(a), wxString::FromUTF8(b));
  if (cmp != 0) {
    return cmp < 0;
  }
  // Names equal under natural comparison (e.g. differing only in case) still
  // need a strict order
  return a < b;
}

namespace // Anonymous namespace for internal linkage helper functions
{
bool is_integer_literal(std::string_view text) {
  std::size_t i = 0;
  if (!text.empty() && (text[0] == '-' || text[0] == '+')) {
    i = 1;
  }
  if (i == text.size()) {
    return false;
  }
  for (; i < text.size(); ++i) {
    if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
      return false;
    }
  }
  return true;
}

bool is_real_literal(std::string_view text) {
  bool sawDigit = false;
  for (char c : text) {
    if (std::isdigit(static_cast<unsigned char>(c))) {
      sawDigit = true;
    } else if (c != '.' && c != 'e' && c != 'E' && c != '-' && c != '+') {
      return false;
    }
  }
  return sawDigit;
}

// Replaces characters invalid in filenames with an underscore
inline char sanitise_char(unsigned char c) noexcept {
  // Defines typical invalid filename characters and control characters
  constexpr std::string_view bad = R"(\/:*?"<>|)";
  return (c <= 31 || bad.find(c) != std::string_view::npos) ? '_' : c;
}
} // namespace

// Types a raw text field: integer, real, boolean or text; blank means empty
CellValue BatchRenamerLogic::ParseScalar(const std::string &text) {
  const std::string trimmed = Trim(text);
  if (trimmed.empty()) {
    return CellValue();
  }
  if (is_integer_literal(trimmed)) {
    try {
      return CellValue::FromInteger(std::stoll(trimmed));
    } catch (const std::exception &) {
      // Too large for an integer; fall through and treat it as a real
    }
  }
  if (is_real_literal(trimmed)) {
    char *end = nullptr;
    const double value = std::strtod(trimmed.c_str(), &end);
    if (end != nullptr && *end == '\0') {
      return CellValue::FromReal(value);
    }
  }
  if (trimmed == "True" || trimmed == "TRUE" || trimmed == "true") {
    return CellValue::FromBoolean(true);
  }
  if (trimmed == "False" || trimmed == "FALSE" || trimmed == "false") {
    return CellValue::FromBoolean(false);
  }
  return CellValue::FromText(text);
}

// Renders a cell for use in a file name. Whole reals lose their fraction
// (3.0 -> "3"); other reals use the shortest text that reads back exactly
std::string BatchRenamerLogic::FormatCellValue(const CellValue &value) {
  switch (value.Kind) {
  case CellKind::Empty:
    return "";
  case CellKind::Text:
    return Trim(value.Text);
  case CellKind::Integer:
    return std::to_string(value.Integer);
  case CellKind::Boolean:
    return value.Boolean ? "True" : "False";
  case CellKind::Real:
    break;
  }

  const double real = value.Real;
  if (std::isnan(real)) {
    return "nan";
  }
  if (std::isinf(real)) {
    return real > 0 ? "inf" : "-inf";
  }
  if (std::floor(real) == real &&
      std::fabs(real) < static_cast<double>(std::numeric_limits<long long>::max())) {
    return std::to_string(static_cast<long long>(real));
  }
  std::string text;
  for (int precision = 1; precision <= std::numeric_limits<double>::max_digits10;
       ++precision) {
    std::ostringstream ss;
    ss << std::setprecision(precision) << real;
    text = ss.str();
    if (std::strtod(text.c_str(), nullptr) == real) {
      break;
    }
  }
  return Trim(text);
}

// Makes a substituted value safe to use inside a single path component
std::string BatchRenamerLogic::SanitiseNameComponent(const std::string &value) {
  std::string out;
  out.reserve(value.size());
  for (unsigned char c : value) {
    out.push_back(sanitise_char(c));
  }
  return out;
}

bool BatchRenamerLogic::IsAllowedSeparatorChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) ||
         AllowedSeparatorPunctuation.find(c) != std::string::npos;
}

bool BatchRenamerLogic::IsAllowedSeparatorText(const std::string &text) {
  return std::all_of(text.begin(), text.end(),
                     [](char c) { return IsAllowedSeparatorChar(c); });
}

std::string BatchRenamerLogic::DescribeError(BatchErrorKind kind) {
  switch (kind) {
  case BatchErrorKind::None:
    return "No error";
  case BatchErrorKind::NotFound:
    return "Not found";
  case BatchErrorKind::InvalidTarget:
    return "Invalid target";
  case BatchErrorKind::EmptySet:
    return "No files";
  case BatchErrorKind::MixedExtensions:
    return "Mixed extensions";
  case BatchErrorKind::DisallowedExtension:
    return "Extension not allowed";
  case BatchErrorKind::UnsupportedFormat:
    return "Unsupported format";
  case BatchErrorKind::ParseFailure:
    return "Unreadable file";
  case BatchErrorKind::MissingColumn:
    return "Missing column";
  case BatchErrorKind::InvalidCharacters:
    return "Invalid characters";
  case BatchErrorKind::CountMismatch:
    return "Count mismatch";
  case BatchErrorKind::RenameFailure:
    return "Rename failed";
  case BatchErrorKind::SplitFailure:
    return "Split failed";
  case BatchErrorKind::InvalidState:
    return "Invalid state";
  }
  return "Unknown error";
}
