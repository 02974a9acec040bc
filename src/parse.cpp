#include "parse.hh"

#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <string>
#include <vector>

#include "value_error.hh"

namespace deltae
{
  static std::string_view trim(std::string_view text)
  {
    const auto is_space = [](char c) {
      return std::isspace(static_cast<unsigned char>(c)) != 0;
    };
    while (!text.empty() && is_space(text.front()))
      text.remove_prefix(1);
    while (!text.empty() && is_space(text.back()))
      text.remove_suffix(1);
    return text;
  }

  static bool parseNumber(std::string_view token, double& out)
  {
    if (!token.empty() && token.front() == '+')
      token.remove_prefix(1);
    if (token.empty())
      return false;

    const char* end = token.data() + token.size();
    auto [ptr, ec] = std::from_chars(token.data(), end, out);
    // from_chars also accepts "nan" and "inf"
    return ec == std::errc() && ptr == end && std::isfinite(out);
  }

  // Split by commas, skipping empty items, and parse exactly three numbers
  static std::array<double, 3> parseTriple(std::string_view text)
  {
    std::vector<std::string_view> items;
    std::size_t start = 0;
    while (start <= text.size())
      {
        std::size_t comma = text.find(',', start);
        if (comma == std::string_view::npos)
          comma = text.size();
        std::string_view item = text.substr(start, comma - start);
        if (!item.empty())
          items.push_back(trim(item));
        start = comma + 1;
      }

    if (items.size() != 3)
      throw BadFormat(std::string(text));

    std::array<double, 3> values;
    for (std::size_t ii = 0; ii < 3; ++ii)
      {
        if (!parseNumber(items[ii], values[ii]))
          throw BadFormat(std::string(text));
      }
    return values;
  }

  LabValue parseLab(std::string_view text)
  {
    const auto v = parseTriple(text);
    return LabValue(v[0], v[1], v[2]);
  }

  LchValue parseLch(std::string_view text)
  {
    const auto v = parseTriple(text);
    return LchValue(v[0], v[1], v[2]);
  }

  XyzValue parseXyz(std::string_view text, const Illuminant& illuminant)
  {
    const auto v = parseTriple(text);
    return XyzValue(v[0], v[1], v[2], illuminant);
  }

  RgbValue parseRgb(std::string_view text)
  {
    const auto v = parseTriple(text);

    std::array<std::uint8_t, 3> channels;
    for (std::size_t ii = 0; ii < 3; ++ii)
      {
        if (v[ii] != std::trunc(v[ii]))
          throw BadFormat(std::string(text));
        if (v[ii] < 0.0 || v[ii] > 255.0)
          throw OutOfBounds(std::string(text));
        channels[ii] = static_cast<std::uint8_t>(v[ii]);
      }
    return RgbValue{channels[0], channels[1], channels[2]};
  }

  int parsePrecision(std::string_view text)
  {
    const std::string_view token = trim(text);
    const char* end = token.data() + token.size();

    int digits = 0;
    auto [ptr, ec] = std::from_chars(token.data(), end, digits);
    if (token.empty() || ec != std::errc() || ptr != end || digits < 0
        || digits > MAX_PRECISION)
      throw BadFormat(std::string(text));
    return digits;
  }

  DEMethod parseMethod(std::string_view text)
  {
    std::string name(trim(text));
    for (char& c : name)
      c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (name == "de2000" || name == "de00" || name == "2000" || name == "00")
      return DE2000{};
    if (name == "de1976" || name == "de76" || name == "1976" || name == "76")
      return DE1976{};
    if (name == "de1994" || name == "de94" || name == "1994" || name == "94"
        || name == "de1994g" || name == "de94g" || name == "1994g"
        || name == "94g")
      return DE1994G;
    if (name == "de1994t" || name == "de94t" || name == "1994t" || name == "94t")
      return DE1994T;
    if (name == "decmc" || name == "decmc1" || name == "cmc1" || name == "cmc")
      return DECMC1;
    if (name == "decmc2" || name == "cmc2")
      return DECMC2;

    throw InvalidInput("unknown Delta E method: '" + std::string(text) + "'");
  }
} // namespace deltae
