#include "text_normalize.hpp"

#include <cctype>
#include <cstdint>
#include <regex>

namespace idsync::similarity {

namespace {

// U+00C0 .. U+00FF
constexpr const char* kLatin1Fold[64] = {
    "A", "A", "A", "A", "A", "A", "AE", "C", "E", "E", "E", "E", "I", "I", "I", "I",   //
    "D", "N", "O", "O", "O", "O", "O",  " ", "O", "U", "U", "U", "U", "Y", "Th", "ss", //
    "a", "a", "a", "a", "a", "a", "ae", "c", "e", "e", "e", "e", "i", "i", "i", "i",   //
    "d", "n", "o", "o", "o", "o", "o",  " ", "o", "u", "u", "u", "u", "y", "th", "y",  //
};

// U+0100 .. U+017F
constexpr const char* kLatinExtendedAFold[128] = {
    "A",  "a",  "A", "a", "A", "a", "C", "c", "C", "c", "C", "c", "C", "c", "D", "d",  //
    "D",  "d",  "E", "e", "E", "e", "E", "e", "E", "e", "E", "e", "G", "g", "G", "g",  //
    "G",  "g",  "G", "g", "H", "h", "H", "h", "I", "i", "I", "i", "I", "i", "I", "i",  //
    "I",  "i",  "IJ", "ij", "J", "j", "K", "k", "k", "L", "l", "L", "l", "L", "l", "L", //
    "l",  "L",  "l", "N", "n", "N", "n", "N", "n", "n", "N", "n", "O", "o", "O", "o",  //
    "O",  "o",  "OE", "oe", "R", "r", "R", "r", "R", "r", "S", "s", "S", "s", "S", "s", //
    "S",  "s",  "T", "t", "T", "t", "T", "t", "U", "u", "U", "u", "U", "u", "U", "u",  //
    "U",  "u",  "U", "u", "W", "w", "Y", "y", "Y", "Z", "z", "Z", "z", "Z", "z", "s",  //
};

constexpr char32_t kNoBreakSpace = 0x00A0;
constexpr char32_t kInvalid      = 0xFFFFFFFF;

/*
  Decodes one code point starting at `pos` and advances `pos`. Malformed
  sequences decode as kInvalid and consume a single byte.
*/
char32_t DecodeUtf8(std::string_view text, std::size_t& pos) {
  const auto lead = static_cast<unsigned char>(text[pos]);
  if (lead < 0x80) {
    ++pos;
    return lead;
  }

  std::size_t length = 0;
  char32_t    cp     = 0;
  if ((lead & 0xE0) == 0xC0) {
    length = 2;
    cp     = lead & 0x1F;
  } else if ((lead & 0xF0) == 0xE0) {
    length = 3;
    cp     = lead & 0x0F;
  } else if ((lead & 0xF8) == 0xF0) {
    length = 4;
    cp     = lead & 0x07;
  } else {
    ++pos;
    return kInvalid;
  }

  if (pos + length > text.size()) {
    ++pos;
    return kInvalid;
  }
  for (std::size_t i = 1; i < length; ++i) {
    const auto cont = static_cast<unsigned char>(text[pos + i]);
    if ((cont & 0xC0) != 0x80) {
      ++pos;
      return kInvalid;
    }
    cp = (cp << 6) | (cont & 0x3F);
  }
  pos += length;
  return cp;
}

// ASCII replacement for a folded code point, nullptr when it has none.
const char* FoldCodePoint(char32_t cp) {
  if (cp >= 0x00C0 && cp <= 0x00FF) return kLatin1Fold[cp - 0x00C0];
  if (cp >= 0x0100 && cp <= 0x017F) return kLatinExtendedAFold[cp - 0x0100];
  switch (cp) {
    case 0x0218:  // S with comma below
      return "S";
    case 0x0219:
      return "s";
    case 0x021A:  // T with comma below
      return "T";
    case 0x021B:
      return "t";
    default:
      return nullptr;
  }
}

std::string Trim(std::string_view input) {
  std::size_t begin = 0;
  std::size_t end   = input.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(input[begin]))) ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(input[end - 1]))) --end;
  return std::string(input.substr(begin, end - begin));
}

std::string ReplaceAll(std::string input, std::string_view from, std::string_view to) {
  if (from.empty()) return input;
  std::size_t pos = 0;
  while ((pos = input.find(from, pos)) != std::string::npos) {
    input.replace(pos, from.size(), to);
    pos += to.size();
  }
  return input;
}

bool IsWordByte(unsigned char c) {
  return c >= 0x80 || std::isalnum(c);
}

} // namespace

std::string CleanSpaces(std::string_view input) {
  std::string out;
  out.reserve(input.size());
  for (std::size_t pos = 0; pos < input.size();) {
    const std::size_t start = pos;
    const char32_t    cp    = DecodeUtf8(input, pos);
    if (cp == kNoBreakSpace) {
      out.push_back(' ');
    } else {
      out.append(input.substr(start, pos - start));
    }
  }
  return Trim(out);
}

std::string RemoveAccents(std::string_view input) {
  std::string out;
  out.reserve(input.size());
  for (std::size_t pos = 0; pos < input.size();) {
    const std::size_t start = pos;
    const char32_t    cp    = DecodeUtf8(input, pos);
    if (cp == kNoBreakSpace) {
      out.push_back(' ');
    } else if (const char* folded = FoldCodePoint(cp)) {
      out.append(folded);
    } else if (cp >= 0x0080 && cp < 0x00C0) {
      // Latin-1 punctuation and symbols
      out.push_back(' ');
    } else {
      out.append(input.substr(start, pos - start));
    }
  }
  return Trim(out);
}

std::string NormalizeText(std::string_view input) {
  const std::string folded = RemoveAccents(CleanSpaces(input));

  std::string out;
  out.reserve(folded.size());
  bool pending_space = false;
  for (const char ch : folded) {
    const auto c = static_cast<unsigned char>(ch);
    if (!IsWordByte(c)) {
      pending_space = true;
      continue;
    }
    if (pending_space && !out.empty()) out.push_back(' ');
    pending_space = false;
    out.push_back(c < 0x80 ? static_cast<char>(std::tolower(c)) : ch);
  }
  return out;
}

std::vector<std::string> Tokenize(std::string_view input) {
  const std::string        normalized = NormalizeText(input);
  std::vector<std::string> tokens;

  std::size_t start = 0;
  while (start < normalized.size()) {
    std::size_t end = normalized.find(' ', start);
    if (end == std::string::npos) end = normalized.size();
    if (end > start) tokens.emplace_back(normalized.substr(start, end - start));
    start = end + 1;
  }
  return tokens;
}

std::string RemoveWomensSuffixes(std::string_view input) {
  static const std::regex kSuffixes[] = {
      std::regex(",?\\s+Women'+s$"), std::regex(",?\\s+Womens$"), std::regex(",?\\s+Women$"),
      std::regex(",?\\s+W$"),        std::regex("\\s+WFC$"),      std::regex("\\s+LFC$"),
      std::regex("\\s+Ladies$"),     std::regex("\\s+F$"),
  };

  std::string out = Trim(input);
  for (const auto& suffix : kSuffixes) out = std::regex_replace(out, suffix, "");

  out = ReplaceAll(std::move(out), ", Women's", "");
  out = ReplaceAll(std::move(out), ", Women", "");
  out = ReplaceAll(std::move(out), " Women's", "");
  out = ReplaceAll(std::move(out), " WFC", "");
  out = ReplaceAll(std::move(out), " Femenino", "");
  out = ReplaceAll(std::move(out), " Femminile", "");
  out = ReplaceAll(std::move(out), "F\xC3\xA9minas", "");
  return Trim(out);
}

std::string RemoveYouthSuffixes(std::string_view input) {
  static const std::regex kUnderDash(" Under-?");
  static const std::regex kSubDash(" Sub-?");
  static const std::regex kUnderSpace(" Under ");
  static const std::regex kUDash(" U-");
  static const std::regex kAgeSuffix(" U\\s?\\d+$");

  std::string out = Trim(input);
  out             = std::regex_replace(out, kUnderDash, " U");
  out             = std::regex_replace(out, kSubDash, " U");
  out             = std::regex_replace(out, kUnderSpace, " U");
  out             = std::regex_replace(out, kUDash, " U");
  out             = std::regex_replace(out, kAgeSuffix, "");
  return Trim(out);
}

std::string NormalizeTeamName(std::string_view input) {
  static const std::regex kClubSuffixes(
      " SC$| Sc$| sc$| FC$| fc$| Fc$| LFC$| CF$| CD$| WFC$| FCW$| HSC$| AC$| AF$| FCO$| Ladies$| Women$| W$|"
      ", W$| F$| Women's$| VF$| FF$| Football$");
  static const std::regex kClubPrefixes("^SC |^FC |^CF |^CD |^RC |^OL |^Olympique de |^Olympique |^WNT |^SKN |^SK |^1\\. ");

  std::string cleaned = RemoveYouthSuffixes(RemoveWomensSuffixes(input));
  cleaned             = std::regex_replace(cleaned, kClubSuffixes, "");
  cleaned             = std::regex_replace(cleaned, kClubPrefixes, "");

  std::string normalized = NormalizeText(cleaned);
  if (normalized.empty()) return NormalizeText(input);
  return normalized;
}

} // namespace idsync::similarity
