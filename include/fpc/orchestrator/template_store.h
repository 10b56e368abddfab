#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace fpc::orchestrator {

struct Template {
  std::uint32_t template_id{0};
  std::int32_t subject{0};
  std::string label;
  std::uint64_t device_id{0};
};

// Persistent template bookkeeping. Template id 0 is never stored.
class TemplateStore {
public:
  virtual ~TemplateStore() = default;
  virtual void Add(std::int32_t subject, std::uint32_t template_id) = 0;
  virtual void Remove(std::int32_t subject, std::uint32_t template_id) = 0;
  virtual std::vector<Template> List(std::int32_t subject) const = 0;
  virtual void Rename(std::int32_t subject, std::uint32_t template_id,
                      const std::string& label) = 0;
};

class MemoryTemplateStore final : public TemplateStore {
public:
  explicit MemoryTemplateStore(std::uint64_t device_id = 0) : device_id_(device_id) {}

  void Add(std::int32_t subject, std::uint32_t template_id) override;
  void Remove(std::int32_t subject, std::uint32_t template_id) override;
  std::vector<Template> List(std::int32_t subject) const override;
  void Rename(std::int32_t subject, std::uint32_t template_id,
              const std::string& label) override;

private:
  mutable std::mutex mutex_;
  std::map<std::int32_t, std::vector<Template>> by_subject_;
  std::uint64_t device_id_;
};

}  // namespace fpc::orchestrator
