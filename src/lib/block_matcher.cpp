#include <lina/block_matcher.hpp>

#include <string>
#include <vector>

namespace lina {

  token
  find_block_end(text_stream& in, const token& open,
                 const formatter_registry& formatters) {
    std::vector<std::string> open_blocks{open.name()};

    while (!in.at_end()) {
      auto c = in.get();
      if (c != '{' || in.peek() != '{') continue;

      in.unget();
      token t = read_token(in, formatters);

      if (t.is_block_open()) {
        open_blocks.push_back(t.name());
        continue;
      }

      if (t.kind() != token_kind::block_close) continue;

      std::string last = std::move(open_blocks.back());
      open_blocks.pop_back();
      if (t.name() != last)
        throw invalid_block("Cannot close block '" + t.name() +
                                "' here. Last open block is '" + last + "'",
                            t.position());

      if (open_blocks.empty()) return t;
    }

    throw invalid_block("Could not find block end for '" + open.name() + "'",
                        open.position());
  }

} // namespace lina
