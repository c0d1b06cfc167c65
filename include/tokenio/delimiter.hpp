#pragma once
#include "tokenio/pattern.hpp"
#include <string>
#include <string_view>

namespace tio {

// Token boundary plus optional stop boundary. Immutable: every with_*
// returns a new Delimiter and leaves *this untouched.
//
// The token pattern is always enabled; setting a disabled one falls back to
// a single newline.
class Delimiter {
public:
  Delimiter();

  const Pattern& token() const noexcept { return token_; }
  const Pattern& stop()  const noexcept { return stop_; }

  Delimiter with_token(Pattern p) const;
  Delimiter with_token_str(std::string s) const;
  // On a bad expression returns *this unchanged and fills err_out.
  Delimiter with_token_regex(std::string_view expr, std::string* err_out = nullptr) const;

  Delimiter with_stop(Pattern p) const;
  Delimiter with_stop_str(std::string s) const;
  // A regex stop is found across chunk edges when its match starts at most
  // 256 bytes before the end of what has been read; longer matches straddling
  // a token boundary depend on the chunk size.
  Delimiter with_stop_regex(std::string_view expr, std::string* err_out = nullptr) const;
  Delimiter without_stop() const;

private:
  Pattern token_;
  Pattern stop_;
};

}
