#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace shread {

// Scope/visibility flags a variable is bound under.
using EnvMode = std::uint32_t;
namespace env_mode {
constexpr EnvMode DEFAULT   = 0;
constexpr EnvMode LOCAL     = 1u << 0;
constexpr EnvMode FUNCTION  = 1u << 1;
constexpr EnvMode GLOBAL    = 1u << 2;
constexpr EnvMode UNIVERSAL = 1u << 3;
constexpr EnvMode EXPORT    = 1u << 4;
constexpr EnvMode UNEXPORT  = 1u << 5;
constexpr EnvMode USER      = 1u << 6;
}

// Destination of field assignments. Every set/set_empty is a visible change.
class Environment {
public:
  virtual ~Environment() = default;

  // Value joined with spaces; nullopt when unset or empty.
  virtual std::optional<std::u32string> get_unless_empty(std::string_view name) const = 0;
  virtual void set(std::string_view name, EnvMode mode, std::vector<std::u32string> values) = 0;
  virtual void set_empty(std::string_view name, EnvMode mode) = 0;
  virtual bool is_read_only(std::string_view name) const = 0;
};

bool valid_var_name(std::string_view name);

class VarStore : public Environment {
public:
  struct Var {
    EnvMode mode = env_mode::DEFAULT;
    std::vector<std::u32string> values;
  };

  using ChangeListener = std::function<void(const std::string& name, const Var& var)>;

  VarStore(); // IFS defaults to space, newline, tab

  std::optional<std::u32string> get_unless_empty(std::string_view name) const override;
  void set(std::string_view name, EnvMode mode, std::vector<std::u32string> values) override;
  void set_empty(std::string_view name, EnvMode mode) override;
  bool is_read_only(std::string_view name) const override;

  const Var* find(std::string_view name) const;
  void erase(std::string_view name);
  void mark_read_only(std::string_view name);
  void add_listener(ChangeListener cb);

  // Names in first-assignment order.
  const std::vector<std::string>& names() const noexcept { return order_; }
  std::uint64_t changes() const noexcept { return changes_; }

private:
  void fire(const std::string& name, const Var& var);

  std::unordered_map<std::string, Var> vars_;
  std::vector<std::string> order_;
  std::unordered_set<std::string> read_only_;
  std::vector<ChangeListener> listeners_;
  std::uint64_t changes_{0};
};

}
