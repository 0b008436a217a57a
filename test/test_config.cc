#include "resplite/common/config.hh"
#include <string>
#include <vector>
#include <assert.h>

static int32_t parse(std::vector<std::string> args, Config &cfg, std::string &err) {
  std::vector<char *> argv;
  for (std::string &a : args) {
    argv.push_back(&a[0]);
  }
  argv.push_back(NULL);
  return parse_config((int)args.size(), argv.data(), cfg, err);
}

static void test_defaults() {
  Config cfg;
  std::string err;
  assert(parse({"prog"}, cfg, err) == 0);
  assert(cfg.host == "127.0.0.1");
  assert(cfg.port == 6379);
  assert(cfg.first_arg == 1);
}

static void test_options() {
  Config cfg;
  std::string err;
  assert(parse({"prog", "-p", "1234", "-h", "0.0.0.0", "foo", "-p"}, cfg, err) == 0);
  assert(cfg.port == 1234);
  assert(cfg.host == "0.0.0.0");
  assert(cfg.first_arg == 5);  // options stop at "foo"
}

static void test_bad_values() {
  Config cfg;
  std::string err;
  assert(parse({"prog", "-p", "0"}, cfg, err) < 0);
  assert(parse({"prog", "-p", "65536"}, cfg, err) < 0);
  assert(parse({"prog", "-p", "12ab"}, cfg, err) < 0);
  assert(parse({"prog", "-h", "localhost"}, cfg, err) < 0);
  assert(err == "bad host: localhost");
  assert(parse({"prog", "-x"}, cfg, err) < 0);
  assert(parse({"prog", "-p"}, cfg, err) < 0);
}

static void test_parse_port() {
  uint16_t port = 0;
  assert(parse_port("1", port) && port == 1);
  assert(parse_port("65535", port) && port == 65535);
  assert(!parse_port("", port));
  assert(!parse_port("-1", port));
  assert(!parse_port(" 80", port));
}

int main() {
  test_defaults();
  test_options();
  test_bad_values();
  test_parse_port();
  return 0;
}
