#include "openscad_compiler.h"

#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>

namespace bricked {

namespace {

constexpr size_t kMaxDiagnosticBytes = 16 * 1024;

bool set_err(std::string *error, const std::string &msg) {
  if (error) *error = msg;
  return false;
}

bool write_file(const std::string &path, const std::string &data, std::string *error) {
  std::FILE *f = std::fopen(path.c_str(), "wb");
  if (!f) return set_err(error, "Cannot write " + path + ": " + std::strerror(errno));
  const size_t n = std::fwrite(data.data(), 1, data.size(), f);
  const bool closed = std::fclose(f) == 0;
  if (n != data.size() || !closed) return set_err(error, "Short write to " + path);
  return true;
}

bool read_file(const std::string &path, size_t limit, std::vector<uint8_t> *out, std::string *error) {
  out->clear();
  std::FILE *f = std::fopen(path.c_str(), "rb");
  if (!f) return set_err(error, "Cannot read " + path + ": " + std::strerror(errno));
  uint8_t buf[8192];
  while (true) {
    const size_t n = std::fread(buf, 1, sizeof(buf), f);
    if (n == 0) break;
    const size_t take = (limit > 0 && out->size() + n > limit) ? limit - out->size() : n;
    out->insert(out->end(), buf, buf + take);
    if (take < n) break;
  }
  std::fclose(f);
  return true;
}

std::string read_text_tail(const std::string &path) {
  std::vector<uint8_t> bytes;
  std::string unused;
  if (!read_file(path, kMaxDiagnosticBytes, &bytes, &unused)) return std::string();
  std::string text(bytes.begin(), bytes.end());
  while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) text.pop_back();
  return text;
}

void remove_job_files(const std::string &scad_path, const std::string &stl_path, const std::string &log_path) {
  unlink(scad_path.c_str());
  unlink(stl_path.c_str());
  unlink(log_path.c_str());
}

}  // namespace

OpenScadMeshCompiler::OpenScadMeshCompiler(OpenScadCompilerOptions options)
    : options_(std::move(options)), next_id_(1) {
  if (options_.maxProcesses == 0) options_.maxProcesses = 1;
}

OpenScadMeshCompiler::~OpenScadMeshCompiler() { Shutdown(); }

bool OpenScadMeshCompiler::EnsureWorkDir(std::string *error) {
  if (!work_dir_.empty()) return true;
  const char *tmp = std::getenv("TMPDIR");
  std::string pattern = std::string((tmp && tmp[0] != '\0') ? tmp : "/tmp") + "/bricked-scad-XXXXXX";
  std::vector<char> buf(pattern.begin(), pattern.end());
  buf.push_back('\0');
  if (!mkdtemp(buf.data())) {
    return set_err(error, std::string("mkdtemp failed: ") + std::strerror(errno));
  }
  work_dir_ = buf.data();
  LogEvent("COMPILER_WORKDIR", 0, work_dir_);
  return true;
}

uint64_t OpenScadMeshCompiler::Submit(const std::string &source, Callback done) {
  Job job;
  job.id = next_id_++;
  job.source = source;
  job.done = std::move(done);
  LogEvent("COMPILER_JOB_QUEUED", job.id);
  queued_.push_back(std::move(job));
  return queued_.back().id;
}

bool OpenScadMeshCompiler::Spawn(Job job, CompileResult *failure) {
  failure->jobId = job.id;
  failure->ok = false;
  std::string error;
  if (!EnsureWorkDir(&error)) return set_err(&failure->error, "phase=spawn\n" + error);

  Running run;
  const std::string stem = work_dir_ + "/job-" + std::to_string(job.id);
  run.scadPath = stem + ".scad";
  run.stlPath = stem + ".stl";
  run.logPath = stem + ".log";
  if (!write_file(run.scadPath, job.source, &error)) return set_err(&failure->error, "phase=spawn\n" + error);

  const int pid = fork();
  if (pid < 0) {
    const int fork_errno = errno;
    remove_job_files(run.scadPath, run.stlPath, run.logPath);
    return set_err(&failure->error, std::string("phase=spawn\nfork failed: ") + std::strerror(fork_errno));
  }
  if (pid == 0) {
    const int log_fd = open(run.logPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0600);
    if (log_fd >= 0) {
      dup2(log_fd, STDOUT_FILENO);
      dup2(log_fd, STDERR_FILENO);
      close(log_fd);
    }
    const char *exe = options_.executable.c_str();
    execlp(exe, exe, "-o", run.stlPath.c_str(), run.scadPath.c_str(), (char *)nullptr);
    std::fprintf(stderr, "exec %s failed: %s\n", exe, std::strerror(errno));
    _exit(127);
  }
  run.pid = pid;
  run.started = std::chrono::steady_clock::now();
  run.job = std::move(job);
  LogEvent("COMPILER_JOB_STARTED", run.job.id, "pid=" + std::to_string(pid));
  running_.push_back(std::move(run));
  return true;
}

CompileResult OpenScadMeshCompiler::Collect(Running *run, int status) {
  CompileResult result;
  result.jobId = run->job.id;
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - run->started).count();
  result.durationMs = (uint32_t)((ms < 0) ? 0 : ms);

  if (WIFEXITED(status) && WEXITSTATUS(status) == 0) {
    std::string error;
    result.ok = read_file(run->stlPath, 0, &result.bytes, &error);
    if (result.ok && result.bytes.empty()) {
      result.ok = false;
      error = "openscad produced an empty mesh.";
    }
    if (!result.ok) result.error = "phase=read\n" + error;
  } else {
    std::string diag = read_text_tail(run->logPath);
    std::string head;
    if (WIFEXITED(status)) {
      head = "openscad exited with status " + std::to_string(WEXITSTATUS(status));
    } else if (WIFSIGNALED(status)) {
      head = "openscad killed by signal " + std::to_string(WTERMSIG(status));
    } else {
      head = "openscad failed";
    }
    result.error = "phase=exit\n" + (diag.empty() ? head : head + "\n" + diag);
  }
  remove_job_files(run->scadPath, run->stlPath, run->logPath);
  return result;
}

size_t OpenScadMeshCompiler::Poll() {
  std::vector<std::pair<Callback, CompileResult>> finished;
  while (!queued_.empty() && running_.size() < options_.maxProcesses) {
    Job job = std::move(queued_.front());
    queued_.pop_front();
    Callback done = job.done;
    CompileResult failure;
    if (!Spawn(std::move(job), &failure)) {
      LogEvent("COMPILER_JOB_FAILED", failure.jobId, "phase=spawn");
      finished.emplace_back(std::move(done), std::move(failure));
    }
  }

  const auto now = std::chrono::steady_clock::now();
  for (size_t i = 0; i < running_.size();) {
    Running &run = running_[i];
    int status = 0;
    const int rc = waitpid(run.pid, &status, WNOHANG);
    if (rc == 0) {
      const auto age = std::chrono::duration_cast<std::chrono::milliseconds>(now - run.started).count();
      if (options_.timeoutMs <= 0 || age < options_.timeoutMs) {
        ++i;
        continue;
      }
      LogEvent("COMPILER_JOB_TIMEOUT", run.job.id, "pid=" + std::to_string(run.pid));
      kill(run.pid, SIGKILL);
      waitpid(run.pid, &status, 0);
    } else if (rc < 0) {
      if (errno == EINTR) {
        ++i;
        continue;
      }
      status = 0xff00;
    }
    CompileResult result = Collect(&run, status);
    LogEvent(result.ok ? "COMPILER_JOB_DONE" : "COMPILER_JOB_FAILED", run.job.id,
             "duration_ms=" + std::to_string(result.durationMs));
    finished.emplace_back(std::move(run.job.done), std::move(result));
    running_.erase(running_.begin() + (std::ptrdiff_t)i);
  }

  for (auto &f : finished) {
    if (f.first) f.first(f.second);
  }
  return finished.size();
}

void OpenScadMeshCompiler::LogEvent(const char *event, uint64_t run_id, const std::string &details) {
  if (!event) return;
  if (details.empty()) {
    std::fprintf(stderr, "[bricked-compiler] %s run_id=%llu\n",
                 event, (unsigned long long)run_id);
  } else {
    std::fprintf(stderr, "[bricked-compiler] %s run_id=%llu %s\n",
                 event, (unsigned long long)run_id, details.c_str());
  }
}

void OpenScadMeshCompiler::Shutdown() {
  queued_.clear();
  for (Running &run : running_) {
    LogEvent("COMPILER_JOB_STOPPING", run.job.id, "pid=" + std::to_string(run.pid));
    kill(run.pid, SIGTERM);
    int status = 0;
    waitpid(run.pid, &status, 0);
    remove_job_files(run.scadPath, run.stlPath, run.logPath);
  }
  running_.clear();
  if (!work_dir_.empty()) {
    rmdir(work_dir_.c_str());
    work_dir_.clear();
  }
}

}  // namespace bricked
