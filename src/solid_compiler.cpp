#include "solid_compiler.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <exception>
#include <utility>

#include "stl_codec.h"

namespace bricked {

namespace {

constexpr double kPi = 3.14159265358979323846;
// OpenSCAD defaults used when $fn is 0.
constexpr double kDefaultFa = 12.0;
constexpr double kDefaultFs = 2.0;

bool set_err(std::string *error, const std::string &msg) {
  if (error) *error = msg;
  return false;
}

enum class TokKind : uint8_t {
  End = 0,
  Ident = 1,
  Number = 2,
  Punct = 3,
};

struct Token {
  TokKind kind = TokKind::End;
  std::string text;
  double number = 0.0;
  char punct = 0;
  uint32_t line = 0;
};

bool phase_error(const char *phase, uint32_t line, const std::string &msg, std::string *error) {
  return set_err(error, std::string("phase=") + phase + " line=" + std::to_string(line) + "\n" + msg);
}

bool lex_error(uint32_t line, const std::string &msg, std::string *error) {
  return phase_error("parse", line, msg, error);
}

bool is_ident_start(char c) { return std::isalpha((unsigned char)c) != 0 || c == '_' || c == '$'; }
bool is_ident_char(char c) { return is_ident_start(c) || std::isdigit((unsigned char)c) != 0; }

bool tokenize(const std::string &s, std::vector<Token> *out, std::string *error) {
  uint32_t line = 1;
  size_t i = 0;
  while (i < s.size()) {
    const char c = s[i];
    if (c == '\n') {
      ++line;
      ++i;
      continue;
    }
    if (std::isspace((unsigned char)c)) {
      ++i;
      continue;
    }
    if (c == '/' && i + 1 < s.size() && s[i + 1] == '/') {
      while (i < s.size() && s[i] != '\n') ++i;
      continue;
    }
    if (c == '/' && i + 1 < s.size() && s[i + 1] == '*') {
      const uint32_t open_line = line;
      i += 2;
      while (i + 1 < s.size() && !(s[i] == '*' && s[i + 1] == '/')) {
        if (s[i] == '\n') ++line;
        ++i;
      }
      if (i + 1 >= s.size()) return lex_error(open_line, "unterminated block comment", error);
      i += 2;
      continue;
    }
    Token tok;
    tok.line = line;
    if (is_ident_start(c)) {
      const size_t b = i;
      while (i < s.size() && is_ident_char(s[i])) ++i;
      tok.kind = TokKind::Ident;
      tok.text = s.substr(b, i - b);
    } else if (std::isdigit((unsigned char)c) ||
               (c == '.' && i + 1 < s.size() && std::isdigit((unsigned char)s[i + 1]))) {
      char *end = nullptr;
      tok.kind = TokKind::Number;
      tok.number = std::strtod(s.c_str() + i, &end);
      const size_t used = (size_t)(end - (s.c_str() + i));
      if (used == 0 || !std::isfinite(tok.number)) return lex_error(line, "invalid number", error);
      i += used;
    } else if (std::string("()[]{},;=-+").find(c) != std::string::npos) {
      tok.kind = TokKind::Punct;
      tok.punct = c;
      ++i;
    } else {
      return lex_error(line, std::string("unexpected character '") + c + "'", error);
    }
    out->push_back(std::move(tok));
  }
  Token end;
  end.kind = TokKind::End;
  end.line = line;
  out->push_back(end);
  return true;
}

struct Value {
  enum class Kind : uint8_t { Number, Bool, List };
  Kind kind = Kind::Number;
  double number = 0.0;
  bool boolean = false;
  std::vector<Value> items;
};

struct Arg {
  std::string name;
  Value value;
};

struct Scope {
  int fn = 0;
};

struct Parser {
  const std::vector<Token> *toks;
  size_t pos;
  std::string *error;

  const Token &peek() const { return (*toks)[pos]; }
  const Token &next() {
    const Token &t = (*toks)[pos];
    if (t.kind != TokKind::End) ++pos;
    return t;
  }
  bool at_punct(char c) const { return peek().kind == TokKind::Punct && peek().punct == c; }
  bool accept(char c) {
    if (!at_punct(c)) return false;
    ++pos;
    return true;
  }
};

bool fail(Parser *p, const std::string &msg) { return lex_error(p->peek().line, msg, p->error); }

bool expect(Parser *p, char c, const char *ctx) {
  if (p->accept(c)) return true;
  return fail(p, std::string("expected '") + c + "' " + ctx);
}

bool check_status(const manifold::Manifold &m, const char *ctx, Parser *p) {
  if (m.Status() == manifold::Manifold::Error::NoError) return true;
  return phase_error("evaluate", p->peek().line,
                     std::string("manifold error in ") + ctx + ": status=" + std::to_string((int)m.Status()),
                     p->error);
}

bool parse_value(Parser *p, Value *out) {
  if (p->accept('-')) {
    if (p->peek().kind != TokKind::Number) return fail(p, "expected number after '-'");
    out->kind = Value::Kind::Number;
    out->number = -p->next().number;
    return true;
  }
  p->accept('+');
  const Token &t = p->peek();
  if (t.kind == TokKind::Number) {
    out->kind = Value::Kind::Number;
    out->number = p->next().number;
    return true;
  }
  if (t.kind == TokKind::Ident && (t.text == "true" || t.text == "false")) {
    out->kind = Value::Kind::Bool;
    out->boolean = p->next().text == "true";
    return true;
  }
  if (p->accept('[')) {
    out->kind = Value::Kind::List;
    out->items.clear();
    if (p->accept(']')) return true;
    while (true) {
      Value item;
      if (!parse_value(p, &item)) return false;
      out->items.push_back(std::move(item));
      if (p->accept(']')) return true;
      if (!expect(p, ',', "between list items")) return false;
    }
  }
  return fail(p, "expected a number, boolean or list");
}

// Called after '('; consumes the closing ')'.
bool parse_args(Parser *p, std::vector<Arg> *out) {
  if (p->accept(')')) return true;
  while (true) {
    Arg arg;
    const Token &t = p->peek();
    if (t.kind == TokKind::Ident && t.text != "true" && t.text != "false") {
      arg.name = p->next().text;
      if (!expect(p, '=', "after argument name")) return false;
    }
    if (!parse_value(p, &arg.value)) return false;
    out->push_back(std::move(arg));
    if (p->accept(')')) return true;
    if (!expect(p, ',', "between arguments")) return false;
  }
}

const Value *find_arg(const std::vector<Arg> &args, const char *name, int positional) {
  for (const Arg &a : args) {
    if (a.name == name) return &a.value;
  }
  int seen = 0;
  for (const Arg &a : args) {
    if (!a.name.empty()) continue;
    if (seen == positional) return &a.value;
    ++seen;
  }
  return nullptr;
}

bool as_number(const Value *v, double *out) {
  if (!v || v->kind != Value::Kind::Number) return false;
  *out = v->number;
  return true;
}

bool as_vec3(const Value *v, manifold::vec3 *out) {
  if (!v || v->kind != Value::Kind::List || v->items.size() != 3) return false;
  double xyz[3];
  for (int i = 0; i < 3; ++i) {
    if (!as_number(&v->items[i], &xyz[i])) return false;
  }
  *out = manifold::vec3(xyz[0], xyz[1], xyz[2]);
  return true;
}

bool arg_bool(const std::vector<Arg> &args, const char *name, bool fallback) {
  const Value *v = find_arg(args, name, -1);
  if (!v) return fallback;
  if (v->kind == Value::Kind::Bool) return v->boolean;
  if (v->kind == Value::Kind::Number) return v->number != 0.0;
  return fallback;
}

int fragments_for(double r, int fn) {
  if (fn > 0) return std::max(fn, 3);
  const double by_angle = 360.0 / kDefaultFa;
  const double by_size = r * 2.0 * kPi / kDefaultFs;
  return (int)std::ceil(std::max(std::min(by_angle, by_size), 5.0));
}

manifold::Manifold union_all(std::vector<manifold::Manifold> parts) {
  if (parts.size() == 1) return parts.front();
  return manifold::Manifold::BatchBoolean(parts, manifold::OpType::Add);
}

bool build_cube(Parser *p, const std::vector<Arg> &args, std::vector<manifold::Manifold> *out) {
  manifold::vec3 size(1.0, 1.0, 1.0);
  const Value *v = find_arg(args, "size", 0);
  double n = 0.0;
  if (as_number(v, &n)) {
    size = manifold::vec3(n, n, n);
  } else if (v && !as_vec3(v, &size)) {
    return fail(p, "cube size must be a number or [x, y, z]");
  }
  if (!(size.x > 0.0 && size.y > 0.0 && size.z > 0.0)) return fail(p, "cube size must be positive");
  const bool center = arg_bool(args, "center", false);
  manifold::Manifold m = manifold::Manifold::Cube(size, center);
  if (!check_status(m, "cube", p)) return false;
  out->push_back(std::move(m));
  return true;
}

bool build_cylinder(Parser *p, const std::vector<Arg> &args, const Scope &scope,
                    std::vector<manifold::Manifold> *out) {
  double h = 1.0;
  double r1 = 1.0;
  double r2 = 1.0;
  double v = 0.0;
  const Value *h_arg = find_arg(args, "h", 0);
  if (h_arg && !as_number(h_arg, &h)) return fail(p, "cylinder h must be a number");
  if (as_number(find_arg(args, "r1", 1), &v)) r1 = v;
  if (as_number(find_arg(args, "r2", 2), &v)) r2 = v;
  if (as_number(find_arg(args, "r", -1), &v)) r1 = r2 = v;
  if (as_number(find_arg(args, "d", -1), &v)) r1 = r2 = v * 0.5;
  if (as_number(find_arg(args, "d1", -1), &v)) r1 = v * 0.5;
  if (as_number(find_arg(args, "d2", -1), &v)) r2 = v * 0.5;
  if (!(h > 0.0)) return fail(p, "cylinder height must be positive");
  if (r1 < 0.0 || r2 < 0.0 || (r1 <= 0.0 && r2 <= 0.0)) return fail(p, "cylinder radius must be positive");

  int fn = scope.fn;
  if (as_number(find_arg(args, "$fn", -1), &v)) fn = (int)v;
  const int seg = fragments_for(std::max(r1, r2), fn);
  const bool center = arg_bool(args, "center", false);
  manifold::Manifold m = manifold::Manifold::Cylinder(h, r1, r2, seg, center);
  if (!check_status(m, "cylinder", p)) return false;
  out->push_back(std::move(m));
  return true;
}

bool build_polyhedron(Parser *p, const std::vector<Arg> &args, std::vector<manifold::Manifold> *out) {
  const Value *points = find_arg(args, "points", 0);
  const Value *faces = find_arg(args, "faces", 1);
  if (!faces) faces = find_arg(args, "triangles", -1);
  if (!points || points->kind != Value::Kind::List || points->items.size() < 4) {
    return fail(p, "polyhedron needs at least four points");
  }
  if (!faces || faces->kind != Value::Kind::List || faces->items.size() < 4) {
    return fail(p, "polyhedron needs at least four faces");
  }

  manifold::MeshGL mesh;
  mesh.numProp = 3;
  mesh.vertProperties.reserve(points->items.size() * 3);
  for (const Value &pt : points->items) {
    manifold::vec3 xyz;
    if (!as_vec3(&pt, &xyz)) return fail(p, "polyhedron point must be [x, y, z]");
    mesh.vertProperties.push_back((float)xyz.x);
    mesh.vertProperties.push_back((float)xyz.y);
    mesh.vertProperties.push_back((float)xyz.z);
  }
  const double point_count = (double)points->items.size();
  for (const Value &face : faces->items) {
    if (face.kind != Value::Kind::List || face.items.size() < 3) {
      return fail(p, "polyhedron face needs at least three indices");
    }
    std::vector<uint32_t> idx;
    idx.reserve(face.items.size());
    for (const Value &i : face.items) {
      double n = 0.0;
      if (!as_number(&i, &n) || n < 0.0 || n >= point_count || n != std::floor(n)) {
        return fail(p, "polyhedron face index out of range");
      }
      idx.push_back((uint32_t)n);
    }
    // Faces arrive clockwise seen from outside; manifold wants counter-clockwise.
    for (size_t k = 1; k + 1 < idx.size(); ++k) {
      mesh.triVerts.push_back(idx[0]);
      mesh.triVerts.push_back(idx[k + 1]);
      mesh.triVerts.push_back(idx[k]);
    }
  }
  manifold::Manifold m(mesh);
  if (!check_status(m, "polyhedron", p)) return false;
  out->push_back(std::move(m));
  return true;
}

bool parse_statement(Parser *p, Scope *scope, std::vector<manifold::Manifold> *out);

bool parse_children(Parser *p, const Scope &scope, std::vector<manifold::Manifold> *out) {
  Scope inner = scope;
  return parse_statement(p, &inner, out);
}

bool parse_statement(Parser *p, Scope *scope, std::vector<manifold::Manifold> *out) {
  if (p->accept(';')) return true;
  if (p->accept('{')) {
    Scope inner = *scope;
    while (!p->accept('}')) {
      if (p->peek().kind == TokKind::End) return fail(p, "unterminated block");
      if (!parse_statement(p, &inner, out)) return false;
    }
    return true;
  }
  if (p->peek().kind != TokKind::Ident) return fail(p, "expected a statement");
  const std::string name = p->next().text;

  if (p->accept('=')) {
    Value v;
    if (!parse_value(p, &v)) return false;
    if (!expect(p, ';', "after assignment")) return false;
    if (name == "$fn") {
      if (v.kind != Value::Kind::Number) return fail(p, "$fn must be a number");
      scope->fn = (int)v.number;
      return true;
    }
    if (name == "$fa" || name == "$fs") return true;
    return fail(p, "unsupported assignment to '" + name + "'");
  }

  if (!expect(p, '(', ("after '" + name + "'").c_str())) return false;
  std::vector<Arg> args;
  if (!parse_args(p, &args)) return false;

  if (name == "union" || name == "translate") {
    std::vector<manifold::Manifold> children;
    if (!parse_children(p, *scope, &children)) return false;
    if (children.empty()) return true;
    manifold::Manifold m = union_all(std::move(children));
    if (name == "translate") {
      manifold::vec3 offset;
      if (!as_vec3(find_arg(args, "v", 0), &offset)) return fail(p, "translate needs [x, y, z]");
      m = m.Translate(offset);
    }
    if (!check_status(m, name.c_str(), p)) return false;
    out->push_back(std::move(m));
    return true;
  }

  bool ok = false;
  if (name == "cube") {
    ok = build_cube(p, args, out);
  } else if (name == "cylinder") {
    ok = build_cylinder(p, args, *scope, out);
  } else if (name == "polyhedron") {
    ok = build_polyhedron(p, args, out);
  } else {
    return fail(p, "unsupported module '" + name + "'");
  }
  if (!ok) return false;
  p->accept(';');
  return true;
}

CompileResult run_compile(uint64_t id, std::string source) {
  const auto started = std::chrono::steady_clock::now();
  CompileResult result;
  result.jobId = id;
  try {
    result.ok = CompileSolidSourceToStl(source, &result.bytes, &result.error);
  } catch (const std::exception &e) {
    result.ok = false;
    result.bytes.clear();
    result.error = std::string("phase=evaluate\n") + e.what();
  }
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started).count();
  result.durationMs = (uint32_t)((ms < 0) ? 0 : ms);
  return result;
}

}  // namespace

bool EvaluateSolidSource(const std::string &source, manifold::Manifold *out, std::string *error) {
  if (!out) return set_err(error, "phase=evaluate\nnull output");
  std::vector<Token> toks;
  if (!tokenize(source, &toks, error)) return false;

  Parser p = {&toks, 0, error};
  Scope scope;
  std::vector<manifold::Manifold> solids;
  while (p.peek().kind != TokKind::End) {
    if (!parse_statement(&p, &scope, &solids)) return false;
  }
  if (solids.empty()) return phase_error("evaluate", p.peek().line, "source produced no geometry", error);
  manifold::Manifold m = union_all(std::move(solids));
  if (!check_status(m, "final union", &p)) return false;
  if (m.IsEmpty()) return phase_error("evaluate", p.peek().line, "result is empty", error);
  *out = std::move(m);
  return true;
}

bool CompileSolidSourceToStl(const std::string &source, std::vector<uint8_t> *bytes, std::string *error) {
  manifold::Manifold m;
  if (!EvaluateSolidSource(source, &m, error)) return false;
  std::string encode_error;
  if (!EncodeBinaryStl(m.GetMeshGL(), bytes, &encode_error)) return set_err(error, "phase=encode\n" + encode_error);
  return true;
}

ManifoldMeshCompiler::ManifoldMeshCompiler(size_t max_workers)
    : max_workers_(max_workers), next_id_(1) {}

ManifoldMeshCompiler::~ManifoldMeshCompiler() {
  queued_.clear();
  for (Running &r : running_) {
    if (r.result.valid()) r.result.wait();
  }
  running_.clear();
}

uint64_t ManifoldMeshCompiler::Submit(const std::string &source, Callback done) {
  Job job;
  job.id = next_id_++;
  job.source = source;
  job.done = std::move(done);
  queued_.push_back(std::move(job));
  return queued_.back().id;
}

size_t ManifoldMeshCompiler::Poll() {
  std::vector<std::pair<Callback, CompileResult>> finished;
  if (max_workers_ == 0) {
    while (!queued_.empty()) {
      Job job = std::move(queued_.front());
      queued_.pop_front();
      CompileResult result = run_compile(job.id, job.source);
      finished.emplace_back(std::move(job.done), std::move(result));
    }
  } else {
    while (!queued_.empty() && running_.size() < max_workers_) {
      Running r;
      r.job = std::move(queued_.front());
      queued_.pop_front();
      r.result = std::async(std::launch::async, run_compile, r.job.id, r.job.source);
      running_.push_back(std::move(r));
    }
    for (size_t i = 0; i < running_.size();) {
      if (running_[i].result.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
        ++i;
        continue;
      }
      CompileResult result = running_[i].result.get();
      finished.emplace_back(std::move(running_[i].job.done), std::move(result));
      running_.erase(running_.begin() + (std::ptrdiff_t)i);
    }
  }
  // Callbacks may Submit() again; the queues are settled by now.
  for (auto &f : finished) {
    if (f.first) f.first(f.second);
  }
  return finished.size();
}

}  // namespace bricked
