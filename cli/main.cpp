/**
 * @file main.cpp
 * @brief sas-tool — Linux one-shot front end over the sas-core library.
 *
 * Responsibilities:
 *  - Parse CLI options (CLI11) into one subcommand per core operation.
 *  - Resolve the meter catalog: --catalog, then the user's config dir, then
 *    the built-in SAS 6.02 catalog.
 *  - Print one `key=value` line per result on stdout (`status=ok ...`) and one
 *    `status=error reason=<token>` line on stderr per failure.
 *
 * Subcommands:
 *  - bcd encode --value N --width W
 *  - bcd decode --hex HEX
 *  - crc --hex HEX [--seed S]
 *  - validation --seq N --id N
 *  - meters [--catalog FILE] [--set name=value]... [--add name=delta]... [--json]
 *  - catalog [--catalog FILE]
 *
 * Exit codes: 0 on success, 2 on any failure reported by the core, 1 on usage errors.
 */

#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "CLI/CLI11.hpp"
#include "nlohmann/json.hpp"

#include "sas/bcd.hpp"
#include "sas/catalog.hpp"
#include "sas/crc.hpp"
#include "sas/registry.hpp"
#include "sas/status.hpp"
#include "sas/validation.hpp"

using json = nlohmann::json;
namespace fs = std::filesystem;

// ---------- small utilities ----------

static int fail(sas::Status st, const std::string& extra = "") {
  std::cerr << "status=error reason=" << sas::to_string(st);
  if (!extra.empty()) std::cerr << " " << extra;
  std::cerr << "\n";
  return 2;
}

static std::string to_hex(const uint8_t* p, size_t n) {
  std::ostringstream os;
  for (size_t i = 0; i < n; ++i)
    os << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(p[i]);
  return os.str();
}

// Accept "0102ff", "01 02 ff" or "0x0102ff".
static bool parse_hex(const std::string& in, std::vector<uint8_t>& out) {
  std::string s;
  size_t i = 0;
  if (in.size() >= 2 && in[0] == '0' && (in[1] == 'x' || in[1] == 'X')) i = 2;
  for (; i < in.size(); ++i) {
    char c = in[i];
    if (c == ' ' || c == ':' || c == '\t') continue;
    if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
    s.push_back(c);
  }
  if (s.size() % 2) return false;
  out.clear();
  for (size_t k = 0; k < s.size(); k += 2)
    out.push_back(static_cast<uint8_t>(std::stoul(s.substr(k, 2), nullptr, 16)));
  return true;
}

// "name=value" → (name, value); false if there is no '=' or the number is bad.
static bool split_kv(const std::string& kv, std::string& name, long long& value) {
  auto eq = kv.find('=');
  if (eq == std::string::npos || eq == 0) return false;
  name = kv.substr(0, eq);
  try {
    size_t used = 0;
    value = std::stoll(kv.substr(eq + 1), &used);
    return used == kv.size() - eq - 1;
  } catch (const std::exception&) {
    return false;
  }
}

// Default catalog file:
//   $XDG_CONFIG_HOME/openslots/meters.json
//   fallback: $HOME/.config/openslots/meters.json
static fs::path default_catalog_path() {
  if (const char* x = std::getenv("XDG_CONFIG_HOME"); x && *x)
    return fs::path(x) / "openslots" / "meters.json";
  const char* home = std::getenv("HOME");
  return fs::path(home ? home : "") / ".config" / "openslots" / "meters.json";
}

// Load the catalog named on the command line, else the user's file if one
// exists, else the built-in one. `source` reports which was used.
static sas::Status load_catalog(const std::string& path, sas::Catalog& out, std::string& source) {
  fs::path p = path.empty() ? default_catalog_path() : fs::path(path);
  std::error_code ec;
  if (path.empty() && !fs::exists(p, ec)) {
    out = sas::sas602_catalog();
    source = "builtin";
    return sas::Status::Ok;
  }

  std::ifstream ifs(p);
  if (!ifs) {
    std::cerr << "status=error reason=open_failed path=" << p.string() << "\n";
    return sas::Status::NotFound;
  }
  std::stringstream buf;
  buf << ifs.rdbuf();
  source = p.string();
  return sas::catalog_from_json(buf.str().c_str(), out);
}

// ---------- subcommand bodies ----------

static int run_bcd_encode(long long value, int width) {
  sas::BcdBytes out;
  sas::Status st = sas::bcd::encode(value, width, out);
  if (!sas::ok(st)) return fail(st, "value=" + std::to_string(value) + " width=" + std::to_string(width));
  std::cout << "status=ok bytes=" << to_hex(out.data(), out.size()) << "\n";
  return 0;
}

static int run_bcd_decode(const std::string& hex) {
  std::vector<uint8_t> bytes;
  if (!parse_hex(hex, bytes)) return fail(sas::Status::InvalidArgument, "hex=" + hex);
  uint64_t value = 0;
  sas::Status st = sas::bcd::decode(bytes.data(), bytes.size(), value);
  if (!sas::ok(st)) return fail(st, "hex=" + hex);
  std::cout << "status=ok value=" << value << "\n";
  return 0;
}

static int run_crc(const std::string& hex, uint32_t seed) {
  std::vector<uint8_t> bytes;
  if (!parse_hex(hex, bytes) || seed > 0xFFFF) return fail(sas::Status::InvalidArgument, "hex=" + hex);
  uint8_t c[2];
  sas::crc::checksum(bytes.data(), bytes.size(), c, static_cast<uint16_t>(seed));
  std::cout << "status=ok crc=" << to_hex(c, 2)
            << " value=0x" << std::hex << std::setw(4) << std::setfill('0')
            << (c[0] | (c[1] << 8)) << std::dec << "\n";
  return 0;
}

static int run_validation(uint32_t seq, uint32_t id) {
  sas::MeterRegistry game;
  sas::Status st = game.set_validation_sequence(seq);
  if (sas::ok(st)) st = game.set_validation_id(id);
  if (!sas::ok(st)) return fail(st, "seq=" + std::to_string(seq) + " id=" + std::to_string(id));

  sas::ValidationNumber vn;
  st = game.validation_number(vn);
  if (!sas::ok(st)) return fail(st);
  std::cout << "status=ok seq=" << seq << " id=" << id << " validation=" << vn.c_str() << "\n";
  return 0;
}

static int run_meters(const std::string& catalog_path,
                      const std::vector<std::string>& sets,
                      const std::vector<std::string>& adds,
                      bool as_json) {
  sas::Catalog catalog;
  std::string source;
  sas::Status st = load_catalog(catalog_path, catalog, source);
  if (!sas::ok(st)) return fail(st, "catalog=" + (source.empty() ? catalog_path : source));

  sas::MeterRegistry game;
  st = game.build(catalog);
  if (!sas::ok(st)) return fail(st, "catalog=" + source);

  for (const auto& kv : sets) {
    std::string name; long long v = 0;
    if (!split_kv(kv, name, v) || v < 0) return fail(sas::Status::InvalidArgument, "set=" + kv);
    sas::Meter* m = game.find(name.c_str());
    if (!m) return fail(sas::Status::NotFound, "meter=" + name);
    if (!m->set(static_cast<uint64_t>(v)))
      std::cerr << "status=ignored meter=" << name << " set=" << v << " value=" << m->value() << "\n";
  }
  for (const auto& kv : adds) {
    std::string name; long long d = 0;
    if (!split_kv(kv, name, d)) return fail(sas::Status::InvalidArgument, "add=" + kv);
    sas::Meter* m = game.find(name.c_str());
    if (!m) return fail(sas::Status::NotFound, "meter=" + name);
    if (!m->increment(d))
      std::cerr << "status=ignored meter=" << name << " add=" << d << "\n";
  }

  json snapshot = json::array();
  for (const sas::Meter& m : game) {
    sas::BcdBytes wire;
    st = m.serialize(wire);
    if (!sas::ok(st)) return fail(st, "meter=" + std::string(m.name().c_str()));

    if (as_json) {
      snapshot.push_back({
        {"id", m.id()},
        {"size", m.size()},
        {"name", m.name().c_str()},
        {"description", m.description().c_str()},
        {"value", m.value()},
        {"bcd", to_hex(wire.data(), wire.size())}
      });
    } else {
      std::cout << "id=0x" << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(m.id())
                << std::dec << " name=" << m.name().c_str()
                << " size=" << static_cast<int>(m.size())
                << " value=" << m.value()
                << " bcd=" << to_hex(wire.data(), wire.size()) << "\n";
    }
  }
  if (as_json) std::cout << json{{"catalog", source}, {"meters", snapshot}}.dump(2) << "\n";
  return 0;
}

static int run_catalog(const std::string& catalog_path) {
  sas::Catalog catalog;
  std::string source;
  sas::Status st = load_catalog(catalog_path, catalog, source);
  if (!sas::ok(st)) return fail(st, "catalog=" + (source.empty() ? catalog_path : source));

  std::string out;
  st = sas::catalog_to_json(catalog, out);
  if (!sas::ok(st)) return fail(st);
  std::cout << out << "\n";
  return 0;
}

int main(int argc, char** argv) {
  CLI::App app{"sas-tool — SAS meter, checksum and validation-number utility"};
  app.require_subcommand(1);

  // bcd
  auto cmd_bcd = app.add_subcommand("bcd", "Packed-decimal encode/decode");
  cmd_bcd->require_subcommand(1);
  long long enc_value = 0; int enc_width = 0;
  auto cmd_enc = cmd_bcd->add_subcommand("encode", "Pack a decimal value into W bytes");
  cmd_enc->add_option("--value", enc_value, "Non-negative integer")->required();
  cmd_enc->add_option("--width", enc_width, "Field width in bytes")->required();
  std::string dec_hex;
  auto cmd_dec = cmd_bcd->add_subcommand("decode", "Read bytes as a big-endian hex number");
  cmd_dec->add_option("--hex", dec_hex, "Bytes as hex (e.g. 12345678)")->required();

  // crc
  std::string crc_hex; uint32_t crc_seed = 0;
  auto cmd_crc = app.add_subcommand("crc", "16-bit SAS checksum of a byte string");
  cmd_crc->add_option("--hex", crc_hex, "Bytes as hex")->required();
  cmd_crc->add_option("--seed", crc_seed, "Initial accumulator (0..65535)");

  // validation
  uint32_t v_seq = 0, v_id = 0;
  auto cmd_val = app.add_subcommand("validation", "Secure-enhanced validation number");
  cmd_val->add_option("--seq", v_seq, "Validation sequence (24-bit)")->required();
  cmd_val->add_option("--id", v_id, "Validation id (24-bit)")->required();

  // meters
  std::string catalog_path;
  std::vector<std::string> sets, adds;
  bool as_json = false;
  auto cmd_meters = app.add_subcommand("meters", "Build a registry and print its meters");
  cmd_meters->add_option("--catalog", catalog_path, "Catalog JSON file");
  cmd_meters->add_option("--set", sets, "Set a meter: name=value (ignored if not higher)");
  cmd_meters->add_option("--add", adds, "Increment a meter: name=delta (ignored if not positive)");
  cmd_meters->add_flag("--json", as_json, "Print a JSON snapshot");

  // catalog
  auto cmd_catalog = app.add_subcommand("catalog", "Print the active catalog as JSON");
  cmd_catalog->add_option("--catalog", catalog_path, "Catalog JSON file");

  CLI11_PARSE(app, argc, argv);

  if (*cmd_enc)     return run_bcd_encode(enc_value, enc_width);
  if (*cmd_dec)     return run_bcd_decode(dec_hex);
  if (*cmd_crc)     return run_crc(crc_hex, crc_seed);
  if (*cmd_val)     return run_validation(v_seq, v_id);
  if (*cmd_meters)  return run_meters(catalog_path, sets, adds, as_json);
  if (*cmd_catalog) return run_catalog(catalog_path);

  std::cerr << "status=error reason=need_exactly_one_command\n";
  return 1;
}
