#include "shread/env.hpp"
#include <algorithm>
#include <cctype>

namespace shread {

bool valid_var_name(std::string_view name) {
  if (name.empty()) return false;
  for (char c : name) {
    if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_')) return false;
  }
  return true;
}

VarStore::VarStore() {
  vars_["IFS"] = Var{env_mode::GLOBAL, {U" \n\t"}};
  order_.emplace_back("IFS");
}

std::optional<std::u32string> VarStore::get_unless_empty(std::string_view name) const {
  const Var* v = find(name);
  if (!v || v->values.empty()) return std::nullopt;
  std::u32string joined;
  for (std::size_t i = 0; i < v->values.size(); ++i) {
    if (i) joined.push_back(U' ');
    joined += v->values[i];
  }
  if (joined.empty()) return std::nullopt;
  return joined;
}

void VarStore::set(std::string_view name, EnvMode mode, std::vector<std::u32string> values) {
  std::string key(name);
  auto it = vars_.find(key);
  if (it == vars_.end()) {
    order_.push_back(key);
    it = vars_.emplace(key, Var{}).first;
  }
  it->second.mode = mode;
  it->second.values = std::move(values);
  fire(key, it->second);
}

// Cleared means bound with zero values, not removed.
void VarStore::set_empty(std::string_view name, EnvMode mode) {
  set(name, mode, {});
}

bool VarStore::is_read_only(std::string_view name) const {
  return read_only_.count(std::string(name)) != 0;
}

const VarStore::Var* VarStore::find(std::string_view name) const {
  auto it = vars_.find(std::string(name));
  return it == vars_.end() ? nullptr : &it->second;
}

void VarStore::erase(std::string_view name) {
  std::string key(name);
  if (vars_.erase(key) == 0) return;
  order_.erase(std::remove(order_.begin(), order_.end(), key), order_.end());
}

void VarStore::mark_read_only(std::string_view name) { read_only_.emplace(name); }

void VarStore::add_listener(ChangeListener cb) { listeners_.push_back(std::move(cb)); }

void VarStore::fire(const std::string& name, const Var& var) {
  ++changes_;
  for (auto& cb : listeners_) cb(name, var);
}

}
