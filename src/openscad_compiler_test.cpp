// openscad_compiler_test.cpp
//
// Process-backed compiler failure paths. Uses stand-in executables so the
// test does not need openscad installed.

#include <dirent.h>
#include <sys/stat.h>

#include <iostream>
#include <string>
#include <vector>

#include "mesh_compiler.h"
#include "openscad_compiler.h"

namespace {

static int g_pass = 0;
static int g_fail = 0;

bool require(bool cond, const char *label) {
  if (cond) {
    std::cout << "  PASS: " << label << "\n";
    ++g_pass;
  } else {
    std::cout << "  FAIL: " << label << "\n";
    ++g_fail;
  }
  return cond;
}

bool starts_with(const std::string &s, const char *prefix) {
  return s.rfind(prefix, 0) == 0;
}

std::vector<bricked::CompileResult> run_jobs(const char *executable, size_t jobs) {
  bricked::OpenScadCompilerOptions options;
  options.executable = executable;
  options.maxProcesses = 1;
  options.timeoutMs = 20000;
  bricked::OpenScadMeshCompiler compiler(options);
  std::vector<bricked::CompileResult> results;
  for (size_t i = 0; i < jobs; ++i) {
    compiler.Submit("cube(1);\n", [&results](const bricked::CompileResult &r) { results.push_back(r); });
  }
  std::string err;
  if (!bricked::DrainMeshCompiler(&compiler, 30000, &err)) std::cout << "  drain: " << err << "\n";
  return results;
}

size_t count_job_files(const std::string &dir) {
  DIR *d = opendir(dir.c_str());
  if (!d) return 0;
  size_t n = 0;
  while (dirent *entry = readdir(d)) {
    if (starts_with(entry->d_name, "job-")) ++n;
  }
  closedir(d);
  return n;
}

void test_missing_executable() {
  std::cout << "\n[openscad_compiler_test] missing executable\n";
  const std::vector<bricked::CompileResult> results = run_jobs("/nonexistent/bricked-openscad", 2);
  if (!require(results.size() == 2, "every job reported")) return;
  require(!results[0].ok && !results[1].ok, "jobs failed");
  require(starts_with(results[0].error, "phase=exit\n"), "failure tagged with exit phase");
  require(results[0].error.find("status 127") != std::string::npos, "exec failure status surfaced");
  require(results[0].jobId != results[1].jobId, "distinct job ids");
}

void test_no_output() {
  std::cout << "\n[openscad_compiler_test] no output\n";
  const std::vector<bricked::CompileResult> results = run_jobs("true", 1);
  if (!require(results.size() == 1, "job reported")) return;
  require(!results[0].ok && starts_with(results[0].error, "phase=read\n"), "missing STL is a read failure");
}

void test_job_files_removed() {
  std::cout << "\n[openscad_compiler_test] job files removed\n";
  std::string dir;
  {
    bricked::OpenScadCompilerOptions options;
    options.executable = "/nonexistent/bricked-openscad";
    options.maxProcesses = 2;
    options.timeoutMs = 20000;
    bricked::OpenScadMeshCompiler compiler(options);
    size_t failed = 0;
    for (int i = 0; i < 3; ++i) {
      compiler.Submit("cube(1);\n", [&failed](const bricked::CompileResult &r) { if (!r.ok) ++failed; });
    }
    std::string err;
    require(bricked::DrainMeshCompiler(&compiler, 30000, &err), "drained");
    require(failed == 3, "all jobs failed");
    dir = compiler.work_dir();
    require(!dir.empty(), "work dir created");
    require(count_job_files(dir) == 0, "no job files left after failures");
  }
  struct stat st;
  require(stat(dir.c_str(), &st) != 0, "work dir removed on shutdown");
}

}  // namespace

int main() {
  std::cout << "[openscad_compiler_test] starting\n";
  test_missing_executable();
  test_no_output();
  test_job_files_removed();
  std::cout << "\n[openscad_compiler_test] " << g_pass << " passed, " << g_fail << " failed\n";
  if (g_fail == 0) {
    std::cout << "[openscad_compiler_test] PASS\n";
    return 0;
  }
  std::cout << "[openscad_compiler_test] FAIL\n";
  return 1;
}
