#include "log_scan/jsonl_decoder.hpp"
#include "log_scan/chunk_reader.hpp"
#include "log_scan/errors.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>

namespace fs = std::filesystem;

static int fails = 0;

static void check(bool ok, const char* what) {
  if (!ok) { std::cerr << "[FAIL] " << what << "\n"; ++fails; }
}

static size_t count_lines(const fs::path& f) {
  std::ifstream in(f); size_t n=0; std::string s; while (std::getline(in,s)) ++n; return n;
}

static bool decode_fails(lscan::JsonlDecoder& d, std::string_view line, std::uint64_t want_line) {
  try { d.decode(line, want_line); }
  catch (const lscan::DecodeError& e) { return e.line() == want_line; }
  return false;
}

int main(){
  const fs::path f = "tests/data/sample.jsonl";
  if (!fs::exists(f)) { std::cerr << "[ERR] missing: " << f << "\n"; return 2; }

  lscan::JsonlDecoder dec;

  lscan::ChunkReader r(f.string(), {});
  uint64_t n=0;
  r.for_each_line([&](std::string_view s){
    lscan::Value v = dec.decode(s, ++n);
    check(v.is_object() && v.find("timestamp") != nullptr, "sample record has timestamp");
  });
  check(n == count_lines(f), "every sample line decoded");

  lscan::Value v = dec.decode(R"({"a":{"b":[1,2.5,"x",true,null]},"s":"q\"\\\n"})", 1);
  check(v.to_json() == R"({"a":{"b":[1,2.5,"x",true,null]},"s":"q\"\\\n"})", "nested decode keeps shape");
  check(v.find("a")->find("b")->at(0)->is_int(), "integers stay integral");
  check(v.find("a")->find("b")->at(1)->is_double(), "fractions are doubles");

  lscan::Value dup = dec.decode(R"({"k":1,"z":0,"k":2})", 1);
  check(dup.to_json() == R"({"k":2,"z":0})", "duplicate key: last wins, first position");

  check(decode_fails(dec, R"({"a":)", 7), "truncated object");
  check(decode_fails(dec, "", 8), "empty line");
  check(decode_fails(dec, "not json", 9), "garbage");
  check(decode_fails(dec, R"({"a":1} {"b":2})", 10), "trailing content");
  check(dec.decode("42", 1) == lscan::Value(42), "default: scalar line decodes");
  check(dec.decode(R"("hi")", 1) == lscan::Value("hi"), "default: string line decodes");
  check(dec.decode("[1,null]", 1).to_json() == "[1,null]", "default: array line decodes");

  lscan::JsonlConfig objects_only; objects_only.strict = true;
  lscan::JsonlDecoder strict(objects_only);
  check(decode_fails(strict, "[1,2]", 11), "strict: array line");
  check(decode_fails(strict, "42", 12), "strict: scalar line");
  check(strict.decode(R"({"a":1})", 13).to_json() == R"({"a":1})", "strict: object line");

  if (fails) return 1;
  std::cout << "[PASS] jsonl rows="<<n<<"\n";
  return 0;
}
