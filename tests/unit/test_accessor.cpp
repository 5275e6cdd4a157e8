#include "log_scan/accessor.hpp"
#include "log_scan/errors.hpp"
#include <iostream>
#include <string>

static int fails = 0;

static void check(bool ok, const char* what) {
  if (!ok) { std::cerr << "[FAIL] " << what << "\n"; ++fails; }
}

static lscan::Value sample() {
  lscan::Value user = lscan::Value::object();
  user.set("name", "ann");
  user.set("tags", lscan::Value::Array{"a", "b"});
  lscan::Value r = lscan::Value::object();
  r.set("level", "info");
  r.set("user", user);
  r.set("gone", nullptr);
  r.set("count", 0);
  return r;
}

int main(){
  const lscan::Value r = sample();

  auto level = lscan::compile_field("level", 1);
  check(level.key == "level", "direct key display name");
  check(level.get(r) == lscan::Value("info"), "direct key lookup");
  check(lscan::compile_field("missing", 1).get(r).is_null(), "missing direct key is null");
  check(lscan::compile_field("count", 1).get(r) == lscan::Value(0), "falsy value is kept");

  auto name = lscan::compile_field("user.name", 2);
  check(name.key == "user.name", "dotted display name");
  check(name.get(r) == lscan::Value("ann"), "dotted lookup");
  check(lscan::compile_field("user.tags.1", 1).get(r) == lscan::Value("b"), "array index segment");
  check(lscan::compile_field("user.tags.9", 1).get(r).is_null(), "array index out of range");

  // Null or absent prefixes short-circuit to null, never throw.
  check(lscan::compile_field("user.oops.deeper", 1).get(r).is_null(), "absent intermediate");
  check(lscan::compile_field("gone.deeper.still", 1).get(r).is_null(), "null intermediate");
  check(lscan::compile_field("level.deeper", 1).get(r).is_null(), "scalar intermediate");
  check(lscan::compile_field("a.b", 1).get(lscan::Value()).is_null(), "null record");

  auto full = lscan::compile_field(lscan::FieldSpec("who", [](const lscan::Value& v) -> lscan::Value {
    const lscan::Value* u = v.find("user");
    return u ? lscan::Value(u->find("name")->as_string() + "!") : lscan::Value();
  }), 3);
  check(full.key == "who", "named accessor key");
  check(full.get(r) == lscan::Value("ann!"), "custom accessor used verbatim");

  auto anon = lscan::compile_field([](const lscan::Value&) { return lscan::Value(1); }, 4);
  check(anon.key == "accessor_4", "anonymous accessor key");

  bool threw = false;
  try { lscan::compile_field("", 1); }
  catch (const lscan::ConfigError& e) { threw = e.code() == lscan::ConfigErrc::InvalidFieldSpecification; }
  check(threw, "empty path rejected");

  threw = false;
  try { lscan::compile_field(lscan::FieldSpec(lscan::Accessor{}), 1); }
  catch (const lscan::ConfigError& e) { threw = e.code() == lscan::ConfigErrc::InvalidFieldSpecification; }
  check(threw, "empty accessor rejected");

  lscan::Projection p;
  p.apply_default();
  check(p.keys() == std::vector<std::string>{"timestamp", "level", "message"}, "default projection");
  p.apply_default();
  check(p.size() == 3, "default installed once");

  lscan::Projection q;
  q.add("level");
  q.add(std::vector<lscan::FieldSpec>{"user.name", "count"});
  q.apply_default();
  check(q.keys() == std::vector<std::string>{"level", "user.name", "count"}, "cumulative add, no default");
  check(q.header_record().to_json() == R"({"level":"level","user.name":"user.name","count":"count"})",
        "header record");
  auto vals = q.extract(r);
  check(vals.size() == 3 && vals[0] == lscan::Value("info") && vals[2] == lscan::Value(0), "extract");

  threw = false;
  try { q.add(std::vector<lscan::FieldSpec>{"ok", ""}); }
  catch (const lscan::ConfigError&) { threw = true; }
  check(threw && q.size() == 3, "bad spec leaves projection unchanged");

  if (fails) return 1;
  std::cout << "[PASS] accessor\n";
  return 0;
}
