#ifndef E1C47B20_93AF_4D0E_8E6B_2F5D17A3C048
#define E1C47B20_93AF_4D0E_8E6B_2F5D17A3C048

#include <linalg.h>
#include <spdlog/fmt/fmt.h>

template <class T, int M> struct fmt::formatter<linalg::vec<T, M>> {
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    auto it = ctx.begin(), end = ctx.end();
    if (it != end && *it != '}')
      throw format_error("invalid format");
    return it;
  }

  template <typename FormatContext> auto format(const linalg::vec<T, M> &vec, FormatContext &ctx) const -> decltype(ctx.out()) {
    auto out = format_to(ctx.out(), "{{");
    for (int i = 0; i < M; i++) {
      if (i > 0)
        out = format_to(out, ", ");
      out = format_to(out, "{}", vec[i]);
    }
    return format_to(out, "}}");
  }
};

#endif /* E1C47B20_93AF_4D0E_8E6B_2F5D17A3C048 */
