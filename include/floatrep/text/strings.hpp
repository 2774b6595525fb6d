#ifndef FLOATREP_TEXT_STRINGS_HPP
#define FLOATREP_TEXT_STRINGS_HPP

#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>

namespace floatrep {

inline std::string_view trimSpace(std::string_view S) {
  constexpr std::string_view Space = " \t\r\n\f\v";
  std::size_t First = S.find_first_not_of(Space);
  if (First == std::string_view::npos)
    return {};
  std::size_t Last = S.find_last_not_of(Space);
  return S.substr(First, Last - First + 1);
}

// Drops a leading "0<Radix>" in either case, e.g. 0b/0B or 0x/0X.
inline std::string_view stripRadixPrefix(std::string_view S, char Radix) {
  if (S.size() >= 2 && S[0] == '0' &&
      std::tolower(static_cast<unsigned char>(S[1])) == Radix)
    return S.substr(2);
  return S;
}

inline std::string toLower(std::string_view S) {
  std::string Out(S);
  for (char &C : Out)
    C = static_cast<char>(std::tolower(static_cast<unsigned char>(C)));
  return Out;
}

} // namespace floatrep

#endif // FLOATREP_TEXT_STRINGS_HPP
