#include <chrono>
#include <cstdarg>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

#include <hiredis/hiredis.h>
#include <nlohmann/json.hpp>

#include "core/agent.hpp"
#include "core/config.hpp"
#include "model/reading.hpp"
#include "model/source.hpp"
#include "probes/command_probe.hpp"
#include "probes/cpu_probe.hpp"
#include "probes/download_probe.hpp"
#include "probes/factory.hpp"
#include "probes/process_probe.hpp"
#include "probes/process_runner.hpp"
#include "probes/terminal_probe.hpp"
#include "sinks/jsonl_events.hpp"
#include "sinks/redis_activity.hpp"

using activity_agent::core::Agent;
using activity_agent::core::AgentConfig;
using activity_agent::core::SourceConfig;
using activity_agent::core::load_agent_config;
using activity_agent::model::active_set;
using activity_agent::model::debounce_state;
using activity_agent::model::reading;
using activity_agent::model::reading_state;
using activity_agent::model::source_id;
using activity_agent::model::transition;
using activity_agent::probes::CancelToken;
using activity_agent::probes::CommandProbe;
using activity_agent::probes::CpuProbe;
using activity_agent::probes::DownloadProbe;
using activity_agent::probes::ProcessProbe;
using activity_agent::probes::SampleContext;
using activity_agent::probes::TerminalProbe;
using activity_agent::probes::command_status;
using activity_agent::probes::parse_sessions;
using activity_agent::probes::probe_kind;
using activity_agent::probes::run_shell;
using activity_agent::sinks::ActivityHealth;
using activity_agent::sinks::JsonlEventSink;
using activity_agent::sinks::RedisActivityOptions;
using activity_agent::sinks::RedisActivitySink;

namespace fs = std::filesystem;

namespace {

struct RedisMockState {
  std::vector<std::string> last_argv{};
  std::vector<std::string> commands{};
  int command_argv_calls{0};
  int connect_calls{0};
  int create_calls{0};
  std::string create_error{};
};

RedisMockState g_redis_mock{};

}

extern "C" {

redisContext* redisConnectWithTimeout(const char*, int, const struct timeval) {
  g_redis_mock.connect_calls += 1;
  auto* context = static_cast<redisContext*>(std::calloc(1, sizeof(redisContext)));
  context->err = REDIS_OK;
  return context;
}

redisContext* redisConnectUnixWithTimeout(const char*, const struct timeval) {
  g_redis_mock.connect_calls += 1;
  auto* context = static_cast<redisContext*>(std::calloc(1, sizeof(redisContext)));
  context->err = REDIS_OK;
  return context;
}

void redisFree(redisContext* c) { std::free(c); }

void* redisCommand(redisContext*, const char* format, ...) {
  g_redis_mock.create_calls += 1;
  char buffer[512];
  va_list args;
  va_start(args, format);
  std::vsnprintf(buffer, sizeof(buffer), format, args);
  va_end(args);
  g_redis_mock.commands.emplace_back(buffer);
  auto* reply = static_cast<redisReply*>(std::calloc(1, sizeof(redisReply)));
  if (!g_redis_mock.create_error.empty()) {
    reply->type = REDIS_REPLY_ERROR;
    reply->str = strdup(g_redis_mock.create_error.c_str());
    reply->len = g_redis_mock.create_error.size();
    return reply;
  }
  reply->type = REDIS_REPLY_STATUS;
  return reply;
}

void* redisCommandArgv(redisContext*, int argc, const char** argv, const size_t*) {
  g_redis_mock.command_argv_calls += 1;
  g_redis_mock.last_argv.clear();
  for (int i = 0; i < argc; ++i) {
    g_redis_mock.last_argv.emplace_back(argv[i]);
  }
  auto* reply = static_cast<redisReply*>(std::calloc(1, sizeof(redisReply)));
  reply->type = REDIS_REPLY_ARRAY;
  return reply;
}

void freeReplyObject(void* reply) {
  auto* typed = static_cast<redisReply*>(reply);
  if (typed != nullptr) {
    std::free(typed->str);
  }
  std::free(reply);
}

}  // extern "C"

namespace {

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

bool almost_equal(float a, float b, float eps = 1e-4F) {
  return std::fabs(a - b) <= eps;
}

// Fresh scratch directory under the system temp dir, removed on destruction.
class TempDir {
 public:
  explicit TempDir(const std::string& tag)
      : path_(fs::temp_directory_path() / ("activity_agent_" + tag + "_" + std::to_string(getpid()))) {
    fs::remove_all(path_);
    fs::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
  }

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  [[nodiscard]] const fs::path& path() const { return path_; }

  void write(const std::string& relative, const std::string& content) const {
    const fs::path target = path_ / relative;
    fs::create_directories(target.parent_path());
    std::ofstream out(target, std::ios::trunc);
    out << content;
  }

 private:
  fs::path path_;
};

bool config_throws(const std::string& tag, const std::string& content) {
  TempDir dir(tag);
  dir.write("agent.yaml", content);
  try {
    (void)load_agent_config((dir.path() / "agent.yaml").string());
  } catch (const std::exception&) {
    return true;
  }
  return false;
}

std::string argv_value_after(const std::string& key) {
  for (std::size_t i = 0; i + 2 < g_redis_mock.last_argv.size(); ++i) {
    if (g_redis_mock.last_argv[i] == key) {
      return g_redis_mock.last_argv[i + 2];
    }
  }
  return {};
}

std::string proc_stat_line(const int pid, const std::string& comm, const unsigned long utime,
                           const unsigned long stime) {
  std::ostringstream out;
  out << pid << " (" << comm << ") S 1 1 1 0 -1 4194304 100 0 0 0 " << utime << ' ' << stime
      << " 0 0 20 0 1 0 100 0 0\n";
  return out.str();
}

int test_source_names_round_trip() {
  for (const auto id : activity_agent::model::all_sources()) {
    const auto parsed = activity_agent::model::parse_source_id(activity_agent::model::to_string(id));
    if (!parsed.has_value() || *parsed != id) {
      return fail("test_source_names_round_trip", "source name should parse back to its identity");
    }
  }
  if (activity_agent::model::parse_source_id("Claude").has_value()) {
    return fail("test_source_names_round_trip", "names are case-sensitive");
  }
  if (activity_agent::model::join_names(active_set{source_id::XCODE, source_id::CLAUDE}) != "claude,xcode") {
    return fail("test_source_names_round_trip", "joined names should follow identity order");
  }
  return 0;
}

int test_config_parsing_edge_cases() {
  if (!config_throws("bad_port", "redis:\n  address: localhost:99999\n")) {
    return fail("test_config_parsing_edge_cases", "bad redis port should throw");
  }
  if (!config_throws("zero_rate", "tick_rate_hz: 0\n")) {
    return fail("test_config_parsing_edge_cases", "tick_rate_hz <= 0 should throw");
  }
  if (!config_throws("unknown_source", "sources:\n  emacs:\n    probe: process\n    process: emacs\n")) {
    return fail("test_config_parsing_edge_cases", "unknown source name should throw");
  }
  if (!config_throws("zero_show", "sources:\n  claude:\n    probe: process\n    process: claude\n    show_after: 0\n")) {
    return fail("test_config_parsing_edge_cases", "show_after=0 should throw");
  }
  if (!config_throws("bad_probe", "sources:\n  claude:\n    probe: applescript\n")) {
    return fail("test_config_parsing_edge_cases", "unknown probe kind should throw");
  }
  if (!config_throws("no_probe", "sources:\n  codex:\n    hide_after: 2\n")) {
    return fail("test_config_parsing_edge_cases", "enabled source without a probe should throw");
  }
  if (!config_throws("bad_band", "sources:\n  codex:\n    probe: cpu\n    process: codex\n    cpu_low: 30\n    cpu_high: 20\n")) {
    return fail("test_config_parsing_edge_cases", "cpu_high below cpu_low should throw");
  }
  if (!config_throws("bad_db", "redis:\n  db: -1\n")) {
    return fail("test_config_parsing_edge_cases", "negative redis.db should throw");
  }
  if (!config_throws("bad_debug", "debug:\n  nobody: true\n")) {
    return fail("test_config_parsing_edge_cases", "debug key for an unknown source should throw");
  }

  TempDir dir("full_config");
  dir.write("agent.yaml",
            "# comment line\n"
            "tick_rate_hz: 4\n"
            "agent:\n"
            "  stdout_debug: false\n"
            "  publish_health: no\n"
            "redis:\n"
            "  address: unix:///run/redis.sock\n"
            "  key_prefix: activity:test\n"
            "  password: hunter2\n"
            "  db: 2\n"
            "diagnostics:\n"
            "  path: /tmp/events.jsonl\n"
            "sources:\n"
            "  claude:\n"
            "    probe: terminal\n"
            "    command: tmux capture-pane -p\n"
            "    pattern: \"esc to interrupt\"\n"
            "    process: claude\n"
            "    hide_after: 5 # slow hide\n"
            "  dropbox:\n"
            "    probe: command\n"
            "    command: dropbox status\n"
            "    timeout_ms: 500\n"
            "  codex:\n"
            "    probe: process\n"
            "    process: codex\n"
            "    every_ticks: 2\n"
            "    idle_every_ticks: 6\n"
            "  downloads:\n"
            "    probe: downloads\n"
            "    extensions: part, crdownload\n"
            "  teams:\n"
            "    enabled: false\n"
            "debug:\n"
            "  claude: true\n");

  AgentConfig config{};
  try {
    config = load_agent_config((dir.path() / "agent.yaml").string());
  } catch (const std::exception& ex) {
    std::cerr << "  " << ex.what() << '\n';
    return fail("test_config_parsing_edge_cases", "valid config should parse");
  }

  if (config.tick_interval != std::chrono::milliseconds(250) || config.stdout_debug || config.publish_health) {
    return fail("test_config_parsing_edge_cases", "top-level settings parsed incorrectly");
  }
  if (!config.redis.enabled || config.redis.unix_socket != "/run/redis.sock" ||
      config.redis.key_prefix != "activity:test" || config.redis.password != "hunter2" || config.redis.db != 2) {
    return fail("test_config_parsing_edge_cases", "redis settings parsed incorrectly");
  }
  if (config.diagnostics_path != "/tmp/events.jsonl") {
    return fail("test_config_parsing_edge_cases", "diagnostics path parsed incorrectly");
  }

  const SourceConfig& claude = config.sources.at(source_id::CLAUDE);
  if (claude.probe.kind != probe_kind::TERMINAL || claude.probe.pattern != "esc to interrupt" ||
      claude.options.debounce.required_to_activate != 1 || claude.options.debounce.required_to_deactivate != 5 ||
      !claude.options.debug) {
    return fail("test_config_parsing_edge_cases", "terminal source parsed incorrectly");
  }
  if (claude.options.timeout != activity_agent::core::kDefaultProbeTimeout) {
    return fail("test_config_parsing_edge_cases", "terminal probe should get the default deadline");
  }
  if (config.sources.at(source_id::DROPBOX).options.timeout != std::chrono::milliseconds(500)) {
    return fail("test_config_parsing_edge_cases", "explicit timeout_ms should win");
  }

  const SourceConfig& codex = config.sources.at(source_id::CODEX);
  if (codex.options.timeout.count() != 0 || codex.options.every_ticks != 2 || codex.options.idle_every_ticks != 6) {
    return fail("test_config_parsing_edge_cases", "process source cadence or deadline parsed incorrectly");
  }

  const auto& extensions = config.sources.at(source_id::DOWNLOADS).probe.extensions;
  if (extensions.size() != 2 || extensions[0] != "part" || extensions[1] != "crdownload") {
    return fail("test_config_parsing_edge_cases", "extension list parsed incorrectly");
  }
  if (config.sources.at(source_id::TEAMS).enabled) {
    return fail("test_config_parsing_edge_cases", "disabled source without a probe should be accepted");
  }

  bool missing_file_threw = false;
  try {
    (void)load_agent_config((dir.path() / "missing.yaml").string());
  } catch (const std::runtime_error&) {
    missing_file_threw = true;
  }
  if (!missing_file_threw) {
    return fail("test_config_parsing_edge_cases", "missing config file should throw");
  }
  return 0;
}

int test_run_shell_statuses() {
  SampleContext context{};
  const auto echoed = run_shell("echo hello", context);
  if (echoed.status != command_status::EXITED || echoed.exit_code != 0 || echoed.output != "hello\n") {
    return fail("test_run_shell_statuses", "echo should exit 0 with captured output");
  }

  const auto failed = run_shell("exit 3", context);
  if (failed.status != command_status::EXITED || failed.exit_code != 3 || failed.succeeded()) {
    return fail("test_run_shell_statuses", "non-zero exit should be reported, not thrown");
  }

  const auto truncated = run_shell("printf 'abcdefgh'", context, 4);
  if (truncated.output != "abcd") {
    return fail("test_run_shell_statuses", "output should be capped at the byte limit");
  }
  return 0;
}

int test_run_shell_kills_at_deadline() {
  SampleContext context{};
  context.deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(100);

  const auto start = std::chrono::steady_clock::now();
  // The grandchild keeps the pipe open; killing the group must still unblock us.
  const auto result = run_shell("sleep 5 & sleep 5", context);
  const auto elapsed = std::chrono::steady_clock::now() - start;

  if (result.status != command_status::TIMED_OUT) {
    return fail("test_run_shell_kills_at_deadline", "expected timed_out status");
  }
  if (elapsed > std::chrono::milliseconds(2000)) {
    return fail("test_run_shell_kills_at_deadline", "deadline was not enforced");
  }

  auto token = std::make_shared<CancelToken>();
  SampleContext cancellable{};
  cancellable.cancel = token;
  std::thread canceller([token]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    token->cancel();
  });
  const auto cancelled = run_shell("sleep 5", cancellable);
  canceller.join();
  if (cancelled.status != command_status::CANCELLED) {
    return fail("test_run_shell_kills_at_deadline", "cancel token should stop the command");
  }
  return 0;
}

int test_command_probe_pattern_and_progress() {
  SampleContext context{};
  context.deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);

  CommandProbe syncing("echo 'Syncing 42% complete'", std::string("Syncing (\\d+)%"));
  const reading active = syncing.sample(context);
  if (!active.active() || !active.progress.has_value() || !almost_equal(*active.progress, 0.42F)) {
    return fail("test_command_probe_pattern_and_progress", "matching output should be active with progress");
  }

  CommandProbe idle("echo 'Up to date'", std::string("Syncing"));
  if (idle.sample(context).active()) {
    return fail("test_command_probe_pattern_and_progress", "non-matching output should be inactive");
  }

  CommandProbe exit_status("true");
  if (!exit_status.sample(context).active()) {
    return fail("test_command_probe_pattern_and_progress", "exit 0 without pattern should be active");
  }

  TempDir proc("command_proc");
  CommandProbe gated("true", std::nullopt, "dropbox", proc.path().string());
  if (gated.available()) {
    return fail("test_command_probe_pattern_and_progress", "missing required process should fail the pre-check");
  }
  return 0;
}

int test_process_probe_against_proc_fixture() {
  TempDir proc("process_proc");
  proc.write("100/comm", "bash\n");
  proc.write("self/comm", "opencode\n");

  ProcessProbe probe("opencode", proc.path().string());
  SampleContext context{};
  if (probe.sample(context).active()) {
    return fail("test_process_probe_against_proc_fixture", "non-pid entries must be ignored");
  }

  proc.write("4242/comm", "opencode\n");
  const reading r = probe.sample(context);
  if (!r.active() || activity_agent::probes::find_processes(proc.path().string(), "opencode") != std::vector<int>{4242}) {
    return fail("test_process_probe_against_proc_fixture", "running process should be active");
  }

  proc.write("777/comm", "long-running-da\n");
  proc.write("777/cmdline", std::string("/usr/local/bin/long-running-daemon") + '\0' + "--foreground" + '\0');
  proc.write("778/comm", "long-running-da\n");
  proc.write("778/cmdline", std::string("long-running-dashboard") + '\0');
  if (activity_agent::probes::find_processes(proc.path().string(), "long-running-daemon") != std::vector<int>{777}) {
    return fail("test_process_probe_against_proc_fixture", "names past the comm limit should match via cmdline");
  }
  if (activity_agent::probes::find_processes(proc.path().string(), "long-running-da").size() != 2) {
    return fail("test_process_probe_against_proc_fixture", "a 15 character name should match comm exactly");
  }

  ProcessProbe missing("opencode", (proc.path() / "nope").string());
  if (missing.sample(context).active()) {
    return fail("test_process_probe_against_proc_fixture", "unreadable proc root should be inactive");
  }
  return 0;
}

int test_cpu_probe_three_way_band() {
  TempDir proc("cpu_proc");
  proc.write("uptime", "100.00 400.00\n");
  proc.write("321/comm", "codex\n");
  proc.write("321/stat", proc_stat_line(321, "codex", 1000, 0));

  CpuProbe probe("codex", 10.0F, 20.0F, proc.path().string(), 100);
  SampleContext context{};
  if (!probe.available()) {
    return fail("test_cpu_probe_three_way_band", "pre-check should see the process");
  }

  if (probe.sample(context).state != reading_state::NEUTRAL) {
    return fail("test_cpu_probe_three_way_band", "first sample is a neutral baseline");
  }

  // 50 ticks over 1 s at 100 Hz = 50 %.
  proc.write("uptime", "101.00 400.00\n");
  proc.write("321/stat", proc_stat_line(321, "codex", 1030, 20));
  if (!probe.sample(context).active() || !almost_equal(*probe.last_cpu_pct(), 50.0F, 0.01F)) {
    return fail("test_cpu_probe_three_way_band", "busy process should be active");
  }

  proc.write("uptime", "102.00 400.00\n");
  proc.write("321/stat", proc_stat_line(321, "codex", 1045, 20));
  if (probe.sample(context).state != reading_state::NEUTRAL) {
    return fail("test_cpu_probe_three_way_band", "15% sits inside the band and must be neutral");
  }

  proc.write("uptime", "103.00 400.00\n");
  proc.write("321/stat", proc_stat_line(321, "codex", 1047, 20));
  const reading quiet = probe.sample(context);
  if (quiet.state != reading_state::INACTIVE || quiet.detail != "cpu=2.0%") {
    return fail("test_cpu_probe_three_way_band", "idle process should be inactive");
  }

  probe.reset();
  if (probe.last_cpu_pct().has_value() || probe.sample(context).state != reading_state::NEUTRAL) {
    return fail("test_cpu_probe_three_way_band", "reset should drop the baseline");
  }
  return 0;
}

int test_download_probe_growth() {
  TempDir downloads("downloads");
  downloads.write("movie.mkv.part", std::string(10, 'x'));
  downloads.write("notes.txt", std::string(10, 'x'));

  DownloadProbe probe(downloads.path().string(), {".part", "CRDOWNLOAD"});
  SampleContext context{};

  const reading first = probe.sample(context);
  if (!first.active() || first.detail != "movie.mkv.part") {
    return fail("test_download_probe_growth", "new partial file should be active");
  }
  if (probe.sample(context).active()) {
    return fail("test_download_probe_growth", "stalled partial file should be inactive");
  }

  downloads.write("movie.mkv.part", std::string(20, 'x'));
  if (!probe.sample(context).active()) {
    return fail("test_download_probe_growth", "growing partial file should be active");
  }

  probe.reset();
  if (!probe.sample(context).active()) {
    return fail("test_download_probe_growth", "reset should forget previous sizes");
  }

  fs::remove(downloads.path() / "movie.mkv.part");
  downloads.write("setup.crdownload", "1");
  if (!probe.sample(context).active()) {
    return fail("test_download_probe_growth", "configured extensions should be normalized");
  }

  DownloadProbe missing((downloads.path() / "gone").string());
  if (missing.sample(context).active()) {
    return fail("test_download_probe_growth", "missing directory should be inactive");
  }
  return 0;
}

int test_terminal_pattern_in_last_lines() {
  const std::string captured =
      "build started\n"
      "esc to interrupt\n"
      "line a\n"
      "line b\n"
      "\n"
      "line c\n"
      "---SESSION---\n"
      "$ ls\n"
      "README.md\n";

  const auto sessions = parse_sessions(captured, 3);
  if (sessions.size() != 2 || sessions[0].last_lines.size() != 3 || sessions[0].last_lines.back() != "line c") {
    return fail("test_terminal_pattern_in_last_lines", "sessions should split and keep the last non-empty lines");
  }

  TerminalProbe narrow("true", "esc to interrupt", 3);
  if (narrow.matches(captured, nullptr)) {
    return fail("test_terminal_pattern_in_last_lines", "match above the line window must be ignored");
  }

  TerminalProbe wide("true", "esc to interrupt", 4);
  std::string line;
  if (!wide.matches(captured, &line) || line != "esc to interrupt") {
    return fail("test_terminal_pattern_in_last_lines", "match inside the line window should be reported");
  }

  const std::string tabs = "---TAB---\nworking (esc to interrupt)\n---TAB---\nidle\n";
  if (!wide.matches(tabs, nullptr)) {
    return fail("test_terminal_pattern_in_last_lines", "tab-delimited captures should be searched too");
  }

  SampleContext context{};
  context.deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  TerminalProbe shell("printf 'thinking\\nesc to interrupt\\n'", "esc to interrupt", 10);
  if (!shell.sample(context).active()) {
    return fail("test_terminal_pattern_in_last_lines", "captured command output should be matched");
  }
  return 0;
}

int test_probe_factory_validation() {
  activity_agent::probes::ProbeSpec spec{};
  spec.kind = probe_kind::TERMINAL;
  spec.command = "tmux capture-pane -p";
  bool threw = false;
  try {
    (void)activity_agent::probes::make_probe(spec);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  if (!threw) {
    return fail("test_probe_factory_validation", "terminal probe without pattern should throw");
  }

  spec.pattern = "esc to interrupt";
  if (activity_agent::probes::make_probe(spec) == nullptr) {
    return fail("test_probe_factory_validation", "complete ProbeSpec should build a probe");
  }
  return 0;
}

int test_redis_sink_publish_logic() {
  g_redis_mock = {};

  RedisActivityOptions options;
  options.publish_health = false;
  options.key_prefix = "activity:test";
  options.sources = {source_id::CLAUDE, source_id::CODEX};

  RedisActivitySink sink(options);
  if (!sink.publish(active_set{source_id::CLAUDE})) {
    return fail("test_redis_sink_publish_logic", "publish should succeed with mock redis");
  }

  if (g_redis_mock.command_argv_calls != 1 || g_redis_mock.create_calls != 3) {
    return fail("test_redis_sink_publish_logic", "expected schema creation and one TS.MADD call");
  }
  if (g_redis_mock.last_argv.empty() || g_redis_mock.last_argv.front() != "TS.MADD") {
    return fail("test_redis_sink_publish_logic", "TS.MADD command not emitted");
  }
  if (argv_value_after("activity:test:source:claude") != "1.000000" ||
      argv_value_after("activity:test:source:codex") != "0.000000" ||
      argv_value_after("activity:test:agent:active_count") != "1.000000") {
    return fail("test_redis_sink_publish_logic", "per-source 0/1 samples or active count missing");
  }
  for (const auto& arg : g_redis_mock.last_argv) {
    if (arg.find("agent:heartbeat") != std::string::npos) {
      return fail("test_redis_sink_publish_logic", "health metrics should be omitted when disabled");
    }
  }

  if (!sink.publish(active_set{}) || g_redis_mock.connect_calls != 1 ||
      argv_value_after("activity:test:source:claude") != "0.000000") {
    return fail("test_redis_sink_publish_logic", "second publish should reuse the connection");
  }
  return 0;
}

int test_redis_health_metrics() {
  g_redis_mock = {};

  RedisActivityOptions options;
  options.key_prefix = "activity:test";
  options.sources = {source_id::XCODE};
  RedisActivitySink sink(options);

  ActivityHealth health{};
  health.dropped_ticks = 7;
  health.timeouts = 2;
  if (!sink.publish(active_set{}, health)) {
    return fail("test_redis_health_metrics", "publish should succeed with mock redis");
  }
  if (argv_value_after("activity:test:agent:dropped_ticks") != "7.000000" ||
      argv_value_after("activity:test:agent:timeouts") != "2.000000" ||
      argv_value_after("activity:test:agent:heartbeat").empty()) {
    return fail("test_redis_health_metrics", "expected health metrics in TS.MADD payload");
  }
  return 0;
}

int test_redis_sink_auth_and_select() {
  g_redis_mock = {};

  RedisActivityOptions options;
  options.password = "s3cret";
  options.db = 3;
  options.publish_health = false;
  options.sources = {source_id::DROPBOX};
  RedisActivitySink sink(options);

  if (!sink.publish(active_set{})) {
    return fail("test_redis_sink_auth_and_select", "publish should succeed after AUTH and SELECT");
  }
  if (g_redis_mock.commands.size() < 2 || g_redis_mock.commands[0] != "AUTH s3cret" ||
      g_redis_mock.commands[1] != "SELECT 3") {
    return fail("test_redis_sink_auth_and_select", "AUTH then SELECT should precede schema creation");
  }

  g_redis_mock = {};
  g_redis_mock.create_error = "WRONGPASS invalid username-password pair";
  RedisActivitySink rejected(options);
  if (rejected.publish(active_set{}) || g_redis_mock.command_argv_calls != 0) {
    return fail("test_redis_sink_auth_and_select", "rejected AUTH must not publish");
  }
  for (const auto& command : g_redis_mock.commands) {
    if (command.rfind("AUTH", 0) != 0) {
      return fail("test_redis_sink_auth_and_select", "nothing but AUTH should be sent after a rejection");
    }
  }
  g_redis_mock = {};
  return 0;
}

int test_redis_sink_disables_without_timeseries() {
  g_redis_mock = {};
  g_redis_mock.create_error = "ERR unknown command 'TS.CREATE'";

  RedisActivityOptions options;
  options.sources = {source_id::CLAUDE};
  RedisActivitySink sink(options);

  if (sink.publish(active_set{source_id::CLAUDE}) || sink.publish(active_set{})) {
    return fail("test_redis_sink_disables_without_timeseries", "publish must fail without RedisTimeSeries");
  }
  if (g_redis_mock.connect_calls != 1 || g_redis_mock.command_argv_calls != 0) {
    return fail("test_redis_sink_disables_without_timeseries", "sink should stop reconnecting once disabled");
  }

  g_redis_mock = {};
  g_redis_mock.create_error = "ERR TSDB: key already exists";
  RedisActivitySink existing(options);
  if (!existing.publish(active_set{})) {
    return fail("test_redis_sink_disables_without_timeseries", "existing series should not block publishing");
  }
  g_redis_mock = {};
  return 0;
}

int test_jsonl_event_sink_output() {
  std::ostringstream out;
  JsonlEventSink sink(out);

  reading cause = activity_agent::model::active_reading("Syncing 3 files");
  cause.progress = 0.5F;
  debounce_state state{};
  state.consecutive_active = 1;
  state.is_active = true;

  sink.on_reading(source_id::DROPBOX, cause, state);
  sink.on_transition(source_id::DROPBOX, transition::ACTIVATED, &cause);
  sink.on_timeout(source_id::DROPBOX, std::chrono::milliseconds(2000));
  sink.on_transition(source_id::DROPBOX, transition::DEACTIVATED, nullptr);

  std::vector<nlohmann::json> records;
  std::istringstream lines(out.str());
  std::string line;
  while (std::getline(lines, line)) {
    records.push_back(nlohmann::json::parse(line));
  }

  if (records.size() != 4 || sink.records_written() != 4) {
    return fail("test_jsonl_event_sink_output", "expected one line per event");
  }
  if (records[0]["event"] != "reading" || records[0]["source"] != "dropbox" ||
      records[0]["reading"]["state"] != "active" || records[0]["consecutive_active"] != 1) {
    return fail("test_jsonl_event_sink_output", "reading record fields mismatch");
  }
  if (!almost_equal(records[1]["cause"]["progress"].get<float>(), 0.5F) || records[1]["active"] != true) {
    return fail("test_jsonl_event_sink_output", "transition record should carry its cause");
  }
  if (records[2]["event"] != "timeout" || records[2]["deadline_ms"] != 2000) {
    return fail("test_jsonl_event_sink_output", "timeout record fields mismatch");
  }
  if (!records[3]["cause"].is_null() || records[3]["active"] != false) {
    return fail("test_jsonl_event_sink_output", "removal transition should have a null cause");
  }
  return 0;
}

int test_jsonl_event_sink_file_append() {
  TempDir dir("jsonl_file");
  const std::string path = (dir.path() / "events.jsonl").string();
  dir.write("events.jsonl", "{\"event\":\"earlier\"}\n");

  {
    auto sink = JsonlEventSink::open(path);
    sink->on_dropped_tick(source_id::FINDER);
    if (sink->records_written() != 1) {
      return fail("test_jsonl_event_sink_file_append", "file sink should count its record");
    }
  }

  std::ifstream in(path);
  std::string first;
  std::string second;
  if (!std::getline(in, first) || !std::getline(in, second)) {
    return fail("test_jsonl_event_sink_file_append", "file sink should append after existing lines");
  }
  const auto record = nlohmann::json::parse(second);
  if (nlohmann::json::parse(first).at("event") != "earlier" || record.at("event") != "dropped_tick" ||
      record.at("source") != "finder") {
    return fail("test_jsonl_event_sink_file_append", "appended record has unexpected content");
  }

  bool threw = false;
  try {
    (void)JsonlEventSink::open((dir.path() / "missing" / "events.jsonl").string());
  } catch (const std::runtime_error&) {
    threw = true;
  }
  if (!threw) {
    return fail("test_jsonl_event_sink_file_append", "unopenable path should throw");
  }
  return 0;
}

int test_end_to_end_agent_pipeline() {
  g_redis_mock = {};

  TempDir scratch("agent_e2e");
  scratch.write("proc/77/comm", "claude\n");

  AgentConfig config{};
  config.tick_interval = std::chrono::milliseconds(10);
  config.stdout_debug = false;
  config.redis.enabled = true;
  config.redis.key_prefix = "activity:e2e";
  config.diagnostics_path = (scratch.path() / "events.jsonl").string();

  SourceConfig claude{};
  claude.probe.kind = probe_kind::PROCESS;
  claude.probe.process = "claude";
  claude.probe.proc_root = (scratch.path() / "proc").string();
  config.sources[source_id::CLAUDE] = claude;

  SourceConfig codex = claude;
  codex.probe.process = "codex";
  config.sources[source_id::CODEX] = codex;

  SourceConfig teams{};
  teams.enabled = false;
  config.sources[source_id::TEAMS] = teams;

  Agent agent(config);
  const auto stats = agent.run_for_ticks(3);
  if (stats.ticks_executed != 3) {
    return fail("test_end_to_end_agent_pipeline", "expected three ticks");
  }
  if (agent.aggregator().active() != active_set{source_id::CLAUDE}) {
    return fail("test_end_to_end_agent_pipeline", "running process should be the only active source");
  }
  if (agent.scheduler().has_source(source_id::TEAMS)) {
    return fail("test_end_to_end_agent_pipeline", "disabled source must not be registered");
  }
  if (stats.publishes != 2 || argv_value_after("activity:e2e:source:claude") != "1.000000" ||
      argv_value_after("activity:e2e:source:codex") != "0.000000") {
    return fail("test_end_to_end_agent_pipeline", "initial and transition publishes expected");
  }

  std::ifstream events(config.diagnostics_path);
  std::string line;
  bool saw_transition = false;
  while (std::getline(events, line)) {
    const auto record = nlohmann::json::parse(line);
    if (record["event"] == "transition" && record["source"] == "claude") {
      saw_transition = true;
    }
  }
  if (!saw_transition) {
    return fail("test_end_to_end_agent_pipeline", "diagnostics log should record the transition");
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_source_names_round_trip(); rc != 0) return rc;
  if (int rc = test_config_parsing_edge_cases(); rc != 0) return rc;
  if (int rc = test_run_shell_statuses(); rc != 0) return rc;
  if (int rc = test_run_shell_kills_at_deadline(); rc != 0) return rc;
  if (int rc = test_command_probe_pattern_and_progress(); rc != 0) return rc;
  if (int rc = test_process_probe_against_proc_fixture(); rc != 0) return rc;
  if (int rc = test_cpu_probe_three_way_band(); rc != 0) return rc;
  if (int rc = test_download_probe_growth(); rc != 0) return rc;
  if (int rc = test_terminal_pattern_in_last_lines(); rc != 0) return rc;
  if (int rc = test_probe_factory_validation(); rc != 0) return rc;
  if (int rc = test_redis_sink_publish_logic(); rc != 0) return rc;
  if (int rc = test_redis_health_metrics(); rc != 0) return rc;
  if (int rc = test_redis_sink_auth_and_select(); rc != 0) return rc;
  if (int rc = test_redis_sink_disables_without_timeseries(); rc != 0) return rc;
  if (int rc = test_jsonl_event_sink_output(); rc != 0) return rc;
  if (int rc = test_jsonl_event_sink_file_append(); rc != 0) return rc;
  if (int rc = test_end_to_end_agent_pipeline(); rc != 0) return rc;

  std::cout << "[PASS] agent unit tests\n";
  return 0;
}
