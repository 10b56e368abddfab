#include <atomic>
#include <charconv>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "fpc/error.h"
#include "fpc/orchestrator/config.h"
#include "fpc/orchestrator/event_bus.h"
#include "fpc/orchestrator/fingerprint_service.h"
#include "fpc/orchestrator/template_store.h"

namespace {

using namespace fpc::orchestrator;

constexpr int kExitOk = 0;
constexpr int kExitUsage = 64;
constexpr int kExitConfig = 78;

constexpr std::uint64_t kSimDeviceId = 0x5EA5;

std::mutex g_output_mutex;

void Print(const std::string& line) {
  std::lock_guard<std::mutex> guard(g_output_mutex);
  std::cout << line << std::endl;
}

void PrintUsage() {
  std::cerr << "Usage: fpc-sim [--data-root=<dir>]\n"
            << "Commands read from stdin:\n"
            << "  enroll <subject>           start an enrollment\n"
            << "  auth <subject>             start an authentication\n"
            << "  remove <subject> <id>      remove a template (0 = all)\n"
            << "  cancel-enroll | cancel-auth\n"
            << "  touch <id>                 sensor reports a match (0 = no match)\n"
            << "  progress <id> <remaining>  sensor reports enrollment progress\n"
            << "  error <code>               sensor reports an error\n"
            << "  removed <id> <subject>     sensor reports a removal\n"
            << "  kill-driver | kill-caller\n"
            << "  user <subject>             switch the active subject\n"
            << "  list <subject>             list enrolled templates\n"
            << "  quit" << std::endl;
}

std::string_view SensorErrorName(SensorError error) {
  switch (error) {
  case SensorError::kHwUnavailable:
    return "hw_unavailable";
  case SensorError::kUnableToProcess:
    return "unable_to_process";
  case SensorError::kTimeout:
    return "timeout";
  case SensorError::kNoSpace:
    return "no_space";
  case SensorError::kCanceled:
    return "canceled";
  case SensorError::kUnableToRemove:
    return "unable_to_remove";
  case SensorError::kLockout:
    return "lockout";
  }
  return "vendor";
}

// Driver that only reports what it is told to through the command loop.
class SimulatedDriver final : public SensorDriver {
public:
  void Init(std::shared_ptr<DriverEventSink> sink) override {
    std::lock_guard<std::mutex> guard(mutex_);
    sink_ = std::move(sink);
  }
  std::uint64_t OpenHal() override { return kSimDeviceId; }
  int CloseHal() override { return 0; }
  std::uint64_t PreEnroll() override { return ++challenge_; }
  int Enroll(std::span<const std::uint8_t>, std::int32_t subject,
             std::uint32_t timeout_seconds) override {
    Print("[driver] enroll subject=" + std::to_string(subject) +
          " timeout=" + std::to_string(timeout_seconds) + "s");
    return 0;
  }
  int CancelEnrollment() override {
    Print("[driver] cancel enrollment");
    return 0;
  }
  int Authenticate(std::uint64_t, std::int32_t subject) override {
    Print("[driver] authenticate subject=" + std::to_string(subject));
    return 0;
  }
  int CancelAuthentication() override {
    Print("[driver] cancel authentication");
    return 0;
  }
  int Remove(std::uint32_t template_id, std::int32_t subject) override {
    Print("[driver] remove id=" + std::to_string(template_id) +
          " subject=" + std::to_string(subject));
    return 0;
  }
  int SetActiveSubject(std::int32_t subject, const std::filesystem::path& storage) override {
    Print("[driver] active subject=" + std::to_string(subject) + " path=" + storage.string());
    return 0;
  }
  std::uint64_t GetAuthenticatorId() override { return 0xA11CE; }
  void LinkToDeath(std::function<void()> on_death) override {
    std::lock_guard<std::mutex> guard(mutex_);
    on_death_ = std::move(on_death);
  }

  std::shared_ptr<DriverEventSink> sink() {
    std::lock_guard<std::mutex> guard(mutex_);
    return sink_;
  }

  void Kill() {
    std::function<void()> on_death;
    {
      std::lock_guard<std::mutex> guard(mutex_);
      on_death = std::move(on_death_);
      sink_.reset();
    }
    if (on_death) {
      on_death();
    }
  }

private:
  std::mutex mutex_;
  std::shared_ptr<DriverEventSink> sink_;
  std::function<void()> on_death_;
  std::atomic<std::uint64_t> challenge_{0};
};

class SimulatedRegistry final : public DriverRegistry {
public:
  std::shared_ptr<SensorDriver> Acquire() override {
    std::lock_guard<std::mutex> guard(mutex_);
    if (!current_) {
      current_ = std::make_shared<SimulatedDriver>();
      Print("[registry] driver started");
    }
    return current_;
  }

  std::shared_ptr<SimulatedDriver> current() {
    std::lock_guard<std::mutex> guard(mutex_);
    return current_;
  }

  void KillCurrent() {
    std::shared_ptr<SimulatedDriver> victim;
    {
      std::lock_guard<std::mutex> guard(mutex_);
      victim = std::move(current_);
    }
    if (victim) {
      victim->Kill();
      Print("[registry] driver killed");
    }
  }

private:
  std::mutex mutex_;
  std::shared_ptr<SimulatedDriver> current_;
};

class AllowAllPolicy final : public AccessPolicy {
public:
  void CheckPermission(CallerToken, Permission) override {}
  bool CanUseSensor(CallerToken, const std::string&) override { return true; }
};

class PrintingSink final : public ResultSink {
public:
  explicit PrintingSink(std::string tag) : tag_(std::move(tag)) {}

  void OnEnrollResult(std::uint64_t, std::uint32_t template_id, std::int32_t subject,
                      std::int32_t remaining) override {
    Print("[" + tag_ + "] enroll_result id=" + std::to_string(template_id) +
          " subject=" + std::to_string(subject) + " remaining=" + std::to_string(remaining));
  }
  void OnAcquired(std::uint64_t, std::int32_t info) override {
    Print("[" + tag_ + "] acquired info=" + std::to_string(info));
  }
  void OnAuthenticated(std::uint64_t, std::uint32_t template_id, std::int32_t subject) override {
    Print("[" + tag_ + "] authenticated id=" + std::to_string(template_id) +
          " subject=" + std::to_string(subject));
  }
  void OnError(std::uint64_t, SensorError error) override {
    Print("[" + tag_ + "] error " + std::string(SensorErrorName(error)) + " (" +
          std::to_string(static_cast<int>(error)) + ")");
  }
  void OnRemoved(std::uint64_t, std::uint32_t template_id, std::int32_t subject) override {
    Print("[" + tag_ + "] removed id=" + std::to_string(template_id) +
          " subject=" + std::to_string(subject));
  }

private:
  std::string tag_;
};

class PrintingFeedback final : public FeedbackSink {
public:
  void Success() override { Print("[haptic] success"); }
  void Error() override { Print("[haptic] error"); }
};

template <class T>
std::optional<T> ParseNumber(std::string_view text) {
  T value{};
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

std::vector<std::string> Split(const std::string& line) {
  std::istringstream iss(line);
  std::vector<std::string> words;
  std::string word;
  while (iss >> word) {
    words.push_back(word);
  }
  return words;
}

class Simulator {
public:
  Simulator(std::shared_ptr<SimulatedRegistry> registry, FingerprintService& service)
      : registry_(std::move(registry)), service_(service) {}

  // Returns false on quit.
  bool Execute(const std::vector<std::string>& words) {
    const std::string& cmd = words.front();
    if (cmd == "quit" || cmd == "exit") {
      return false;
    }
    if (cmd == "enroll" && words.size() == 2) {
      auto subject = ParseNumber<std::int32_t>(words[1]);
      if (!subject) {
        return Usage();
      }
      EnrollRequest request{};
      request.subject = *subject;
      request.auth_token.assign(8, 0);
      service_.Enroll(caller_, request, std::make_shared<PrintingSink>("enroll"));
      return true;
    }
    if (cmd == "auth" && words.size() == 2) {
      auto subject = ParseNumber<std::int32_t>(words[1]);
      if (!subject) {
        return Usage();
      }
      AuthenticateRequest request{};
      request.subject = *subject;
      request.operation_id = ++operation_;
      service_.Authenticate(caller_, request, std::make_shared<PrintingSink>("auth"), "fpc-sim");
      return true;
    }
    if (cmd == "remove" && words.size() == 3) {
      auto subject = ParseNumber<std::int32_t>(words[1]);
      auto id = ParseNumber<std::uint32_t>(words[2]);
      if (!subject || !id) {
        return Usage();
      }
      service_.Remove(caller_, RemoveRequest{*id, *subject},
                      std::make_shared<PrintingSink>("remove"));
      return true;
    }
    if (cmd == "cancel-enroll") {
      service_.CancelEnrollment(caller_);
      return true;
    }
    if (cmd == "cancel-auth") {
      service_.CancelAuthentication(caller_, "fpc-sim");
      return true;
    }
    if (cmd == "touch" && words.size() == 2) {
      auto id = ParseNumber<std::uint32_t>(words[1]);
      if (!id) {
        return Usage();
      }
      return Emit([&](DriverEventSink& sink) {
        sink.OnAcquired(kSimDeviceId, 0);
        sink.OnAuthenticated(kSimDeviceId, *id, subject_);
      });
    }
    if (cmd == "progress" && words.size() == 3) {
      auto id = ParseNumber<std::uint32_t>(words[1]);
      auto remaining = ParseNumber<std::int32_t>(words[2]);
      if (!id || !remaining) {
        return Usage();
      }
      return Emit([&](DriverEventSink& sink) {
        sink.OnAcquired(kSimDeviceId, 0);
        sink.OnEnrollResult(kSimDeviceId, *id, subject_, *remaining);
      });
    }
    if (cmd == "error" && words.size() == 2) {
      auto code = ParseNumber<std::int32_t>(words[1]);
      if (!code) {
        return Usage();
      }
      return Emit([&](DriverEventSink& sink) { sink.OnError(kSimDeviceId, *code); });
    }
    if (cmd == "removed" && words.size() == 3) {
      auto id = ParseNumber<std::uint32_t>(words[1]);
      auto subject = ParseNumber<std::int32_t>(words[2]);
      if (!id || !subject) {
        return Usage();
      }
      return Emit([&](DriverEventSink& sink) { sink.OnRemoved(kSimDeviceId, *id, *subject); });
    }
    if (cmd == "kill-driver") {
      registry_->KillCurrent();
      return true;
    }
    if (cmd == "kill-caller") {
      service_.OnCallerDied(caller_);
      Print("[sim] caller " + std::to_string(caller_) + " died");
      ++caller_;
      return true;
    }
    if (cmd == "user" && words.size() == 2) {
      auto subject = ParseNumber<std::int32_t>(words[1]);
      if (!subject) {
        return Usage();
      }
      subject_ = *subject;
      service_.OnActiveSubjectChanged(subject_);
      return true;
    }
    if (cmd == "list" && words.size() == 2) {
      auto subject = ParseNumber<std::int32_t>(words[1]);
      if (!subject) {
        return Usage();
      }
      const auto templates = service_.GetEnrolledTemplates(caller_, *subject, "fpc-sim");
      Print("[sim] " + std::to_string(templates.size()) + " template(s)");
      for (const auto& entry : templates) {
        Print("  id=" + std::to_string(entry.template_id) + " label=\"" + entry.label + "\"");
      }
      return true;
    }
    return Usage();
  }

private:
  bool Usage() {
    Print("[sim] unrecognized command; type 'help' for usage");
    return true;
  }

  template <class Fn>
  bool Emit(Fn&& fn) {
    auto driver = registry_->current();
    auto sink = driver ? driver->sink() : nullptr;
    if (!sink) {
      Print("[sim] driver is not running");
      return true;
    }
    fn(*sink);
    return true;
  }

  std::shared_ptr<SimulatedRegistry> registry_;
  FingerprintService& service_;
  CallerToken caller_{1};
  std::int32_t subject_{0};
  std::uint64_t operation_{0};
};

}  // namespace

int main(int argc, char** argv) {
  try {
    CoordinatorConfig config = LoadConfigFromEnvironment();
    for (int index = 1; index < argc; ++index) {
      std::string_view arg = argv[index];
      constexpr std::string_view kDataRoot{"--data-root="};
      if (arg.starts_with(kDataRoot) && arg.size() > kDataRoot.size()) {
        config.data_root = std::filesystem::path(std::string(arg.substr(kDataRoot.size())));
        continue;
      }
      PrintUsage();
      return kExitUsage;
    }

    auto registry = std::make_shared<SimulatedRegistry>();
    FingerprintService::Dependencies deps{};
    deps.registry = registry;
    deps.templates = std::make_shared<MemoryTemplateStore>(kSimDeviceId);
    deps.access = std::make_shared<AllowAllPolicy>();
    deps.feedback = std::make_shared<PrintingFeedback>();

    FingerprintService service(std::move(deps), config);
    service.Start(0);
    Simulator sim(registry, service);

    std::string line;
    while (std::getline(std::cin, line)) {
      auto words = Split(line);
      if (words.empty()) {
        continue;
      }
      if (words.front() == "help") {
        PrintUsage();
        continue;
      }
      try {
        if (!sim.Execute(words)) {
          break;
        }
      } catch (const fpc::Error& err) {
        Print("[sim] request failed: " + std::string(err.what()));
      }
    }
    service.Stop();
    return kExitOk;
  } catch (const fpc::Error& err) {
    std::cerr << (err.domain == fpc::ErrorDomain::Config ? "Configuration error: " : "Error: ")
              << err.what();
    for (const auto& ctx : err.context) {
      std::cerr << " (" << ctx << ")";
    }
    std::cerr << std::endl;
    return err.domain == fpc::ErrorDomain::Config ? kExitConfig : kExitUsage;
  } catch (const std::exception& err) {
    std::cerr << "Error: " << err.what() << std::endl;
    return kExitUsage;
  }
}
