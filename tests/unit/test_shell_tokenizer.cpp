#include "shread/shell_tokenizer.hpp"

#include <iostream>
#include <string>
#include <vector>

using V = std::vector<std::u32string>;

static int failures = 0;

static void check(bool ok, const char* what) {
  std::cout << (ok ? "[PASS] " : "[FAIL] ") << what << "\n";
  if (!ok) ++failures;
}

static V raw_tokens(std::u32string_view s) {
  shread::ShellTokenizer tok(s);
  V out;
  while (auto t = tok.next()) out.emplace_back(tok.text_of(*t));
  return out;
}

int main(){
  check(raw_tokens(U"  a b\tc  ") == V{U"a", U"b", U"c"}, "whitespace separates words");
  check(raw_tokens(U"'a b' \"c d\" e\\ f") == V{U"'a b'", U"\"c d\"", U"e\\ f"}, "quotes and escapes hold words together");
  check(raw_tokens(U"x'y z'w next") == V{U"x'y z'w", U"next"}, "quote in the middle of a word");
  check(raw_tokens(U"ok 'never closed") == V{U"ok", U"'never closed"}, "unterminated quote runs to the end");
  check(raw_tokens(U"").empty() && raw_tokens(U"   ").empty(), "no words in blank input");

  {
    shread::ShellTokenizer tok(U"one  two three");
    (void)tok.next();
    auto t = tok.next();
    check(t && t->offset == 5 && t->length == 3, "token offsets index the source");
  }

  check(shread::unescape_string(U"'a b'") == std::u32string(U"a b"), "single quotes removed");
  check(shread::unescape_string(U"\"say \\\"hi\\\"\"") == std::u32string(U"say \"hi\""), "escaped double quote");
  check(shread::unescape_string(U"'it\\'s'") == std::u32string(U"it's"), "escaped single quote");
  check(shread::unescape_string(U"a\\ b") == std::u32string(U"a b"), "escaped space");
  check(shread::unescape_string(U"\\t\\n\\x41\\u00e9\\101") == std::u32string(U"\t\nA\u00e9A"), "escape sequences");
  check(shread::unescape_string(U"'\\n'") == std::u32string(U"\\n"), "no escapes inside single quotes");
  check(shread::unescape_string(U"\"$HOME\"") == std::u32string(U"$HOME"), "no expansion");
  check(!shread::unescape_string(U"'open"), "unterminated quote fails");
  check(!shread::unescape_string(U"trail\\"), "trailing backslash fails");

  if (failures) { std::cerr << "[FAIL] shell_tokenizer: " << failures << " failures\n"; return 1; }
  std::cout << "[PASS] shell_tokenizer\n";
  return 0;
}
