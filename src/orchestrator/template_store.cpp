#include "fpc/orchestrator/template_store.h"

#include <algorithm>

namespace fpc::orchestrator {

void MemoryTemplateStore::Add(std::int32_t subject, std::uint32_t template_id) {
  if (template_id == 0) {
    return;
  }
  std::lock_guard<std::mutex> guard(mutex_);
  auto& entries = by_subject_[subject];
  const bool known = std::any_of(entries.begin(), entries.end(), [&](const Template& t) {
    return t.template_id == template_id;
  });
  if (known) {
    return;
  }
  entries.push_back(Template{template_id, subject,
                             "Fingerprint " + std::to_string(template_id), device_id_});
}

void MemoryTemplateStore::Remove(std::int32_t subject, std::uint32_t template_id) {
  std::lock_guard<std::mutex> guard(mutex_);
  auto it = by_subject_.find(subject);
  if (it == by_subject_.end()) {
    return;
  }
  auto& entries = it->second;
  entries.erase(std::remove_if(entries.begin(), entries.end(),
                               [&](const Template& t) { return t.template_id == template_id; }),
                entries.end());
  if (entries.empty()) {
    by_subject_.erase(it);
  }
}

std::vector<Template> MemoryTemplateStore::List(std::int32_t subject) const {
  std::lock_guard<std::mutex> guard(mutex_);
  auto it = by_subject_.find(subject);
  if (it == by_subject_.end()) {
    return {};
  }
  return it->second;
}

void MemoryTemplateStore::Rename(std::int32_t subject, std::uint32_t template_id,
                                 const std::string& label) {
  std::lock_guard<std::mutex> guard(mutex_);
  auto it = by_subject_.find(subject);
  if (it == by_subject_.end()) {
    return;
  }
  for (auto& entry : it->second) {
    if (entry.template_id == template_id) {
      entry.label = label;
    }
  }
}

}  // namespace fpc::orchestrator
