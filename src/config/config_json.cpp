#include "tokenio/config_json.hpp"
#include "tokenio/hooks.hpp"
#include "tokenio/pattern.hpp"

#include <re2/re2.h>
#include <simdjson.h>
#include <memory>
#include <string>
#include <vector>

namespace tio {

namespace {

using simdjson::ondemand::json_type;
using simdjson::ondemand::value;

struct ParseError {
  std::string msg;
};

[[noreturn]] void fail(std::string msg) { throw ParseError{std::move(msg)}; }

// "token"/"stop": a bare string is a literal; an object names one kind.
Pattern read_pattern(value v, std::string_view key) {
  if (v.type().value() == json_type::string) {
    std::string_view s = v.get_string();
    return Pattern::literal(std::string(s));
  }
  if (v.type().value() != json_type::object) fail(std::string(key) + ": expected string or object");

  std::optional<Pattern> out;
  for (auto field : v.get_object()) {
    std::string_view k = field.unescaped_key();
    std::string_view s = field.value().get_string();
    if (out) fail(std::string(key) + ": give exactly one of literal/regex");
    if (k == "literal") {
      out = Pattern::literal(std::string(s));
    } else if (k == "regex") {
      std::string err;
      out = Pattern::compile(s, &err);
      if (!out) fail(std::string(key) + ": " + err);
    } else {
      fail(std::string(key) + ": unknown key '" + std::string(k) + "'");
    }
  }
  if (!out) fail(std::string(key) + ": empty pattern object");
  return *out;
}

NormalizeFn read_normalize(value v) {
  std::vector<NormalizeFn> steps;
  auto add = [&](std::string_view name) {
    auto n = normalizer_by_name(name);
    if (!n) fail("normalize: unknown normalizer '" + std::string(name) + "'");
    if (*n) steps.push_back(std::move(*n));
  };

  if (v.type().value() == json_type::string) {
    add(v.get_string());
  } else if (v.type().value() == json_type::array) {
    for (auto el : v.get_array()) add(el.get_string());
  } else {
    fail("normalize: expected string or array");
  }

  if (steps.empty()) return NormalizeFn{};
  if (steps.size() == 1) return steps.front();
  return normalize::chain(std::move(steps));
}

FilterFn read_filter(value v) {
  if (v.type().value() == json_type::null) return FilterFn{};
  if (v.type().value() != json_type::object) fail("filter: expected object");

  std::vector<FilterFn> parts;
  for (auto field : v.get_object()) {
    std::string_view k = field.unescaped_key();
    value fv = field.value();
    if (k == "non_empty") {
      if (bool(fv.get_bool())) parts.emplace_back(filter::non_empty);
    } else if (k == "numeric") {
      if (bool(fv.get_bool())) parts.emplace_back(filter::numeric);
    } else if (k == "min_length") {
      parts.push_back(filter::min_length(static_cast<std::size_t>(std::uint64_t(fv.get_uint64()))));
    } else if (k == "max_length") {
      parts.push_back(filter::max_length(static_cast<std::size_t>(std::uint64_t(fv.get_uint64()))));
    } else if (k == "regex") {
      std::string_view expr = fv.get_string();
      RE2::Options opts;
      opts.set_log_errors(false);
      auto re = std::make_shared<const RE2>(re2::StringPiece(expr.data(), expr.size()), opts);
      if (!re->ok()) fail("filter.regex: " + re->error());
      parts.push_back(filter::matches(std::move(re)));
    } else {
      fail("filter: unknown key '" + std::string(k) + "'");
    }
  }

  if (parts.empty()) return FilterFn{};
  FilterFn f = parts.front();
  for (std::size_t i = 1; i < parts.size(); ++i) f = filter::all_of(std::move(f), parts[i]);
  return f;
}

ReaderConfig parse_document(simdjson::padded_string_view json, const ReaderConfig& base) {
  thread_local simdjson::ondemand::parser parser;
  simdjson::ondemand::document doc = parser.iterate(json);

  ReaderConfig cfg = base;
  Delimiter delim = base.delimiter();

  for (auto field : doc.get_object()) {
    std::string_view k = field.unescaped_key();
    value v = field.value();
    if (k == "token") {
      delim = delim.with_token(read_pattern(v, k));
    } else if (k == "stop") {
      delim = (v.type().value() == json_type::null) ? delim.without_stop()
                                                    : delim.with_stop(read_pattern(v, k));
    } else if (k == "normalize") {
      cfg = cfg.with_normalizer(read_normalize(v));
    } else if (k == "filter") {
      cfg = cfg.with_filter(read_filter(v));
    } else if (k == "fail_on_error") {
      cfg = cfg.with_fail_on_error(bool(v.get_bool()));
    } else if (k == "fail_on_invalid") {
      cfg = cfg.with_fail_on_invalid(bool(v.get_bool()));
    } else if (k == "chunk_bytes") {
      std::uint64_t n = v.get_uint64();
      if (n == 0) fail("chunk_bytes: must be positive");
      cfg = cfg.with_chunk_bytes(static_cast<std::size_t>(n));
    } else if (k == "max_token_bytes") {
      cfg = cfg.with_max_token_bytes(static_cast<std::size_t>(std::uint64_t(v.get_uint64())));
    } else {
      fail("unknown key '" + std::string(k) + "'");
    }
  }
  return cfg.with_delimiter(std::move(delim));
}

}

std::optional<NormalizeFn> normalizer_by_name(std::string_view name) {
  if (name == "trim")  return NormalizeFn(normalize::trim_space);
  if (name == "upper") return NormalizeFn(normalize::to_upper);
  if (name == "lower") return NormalizeFn(normalize::to_lower);
  if (name == "none")  return NormalizeFn{};
  return std::nullopt;
}

std::optional<ReaderConfig> parse_reader_config(std::string_view json, std::string* err_out,
                                                const ReaderConfig& base) {
  try {
    simdjson::padded_string padded(json);
    return parse_document(padded, base);
  } catch (const ParseError& e) {
    if (err_out) *err_out = e.msg;
  } catch (const simdjson::simdjson_error& e) {
    if (err_out) *err_out = std::string("json: ") + e.what();
  }
  return std::nullopt;
}

std::optional<ReaderConfig> load_reader_config(const std::string& path, std::string* err_out,
                                               const ReaderConfig& base) {
  simdjson::padded_string json;
  if (auto error = simdjson::padded_string::load(path).get(json)) {
    if (err_out) *err_out = "cannot load '" + path + "': " + simdjson::error_message(error);
    return std::nullopt;
  }
  return parse_reader_config(std::string_view(json.data(), json.size()), err_out, base);
}

}
