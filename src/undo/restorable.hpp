#pragma once

#include <functional>
#include <utility>

namespace undostack {

/**
 * @brief Capability implemented by the object that owns the recorded state.
 *
 * History calls restore() during undo and redo with the value being
 * brought back. It is the only way the history touches application data.
 */
template <typename T>
struct IRestorable {
    virtual ~IRestorable() = default;

    /**
     * @brief Apply a recorded value to the live state.
     * @param value The value to restore.
     */
    virtual void restore(const T &value) = 0;
};

/**
 * @brief Restorable that forwards to a setter function.
 *
 * Useful when the state lives in a struct that should not implement
 * IRestorable itself.
 */
template <typename T>
class FunctionRestorable : public IRestorable<T> {
  public:
    using Setter = std::function<void(const T &)>;

    explicit FunctionRestorable(Setter set) : m_set(std::move(set)) {}

    void restore(const T &value) override { m_set(value); }

  private:
    Setter m_set;
};

} // namespace undostack
