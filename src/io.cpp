#include "eff-scope/io.hpp"
#include "fmt/ostream.h"

namespace effscope {

void put_line(const io& h, std::string_view text) {
  auto& out = h.output("io::put_line");
  fmt::print(out, "{}\n", text);
  out.flush();
}

std::optional<std::string> read_line(const io& h) {
  auto& in = h.input("io::read_line");
  std::string line;
  if (!std::getline(in, line)) {
    return std::nullopt;
  }
  return line;
}

}  // namespace effscope
