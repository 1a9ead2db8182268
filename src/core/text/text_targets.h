#pragma once

// Named text outputs (info panel fields). A target may be absent; callers skip it.

#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace OrbitView
{
    class ITextTarget
    {
    public:
        virtual ~ITextTarget() = default;

        virtual void set_text(std::string_view text) = 0;
    };

    // Non-owning name -> target map.
    class TextTargets
    {
    public:
        void add(const std::string &name, ITextTarget *target);
        void remove(const std::string &name);

        // Returns nullptr when no target is registered under `name`.
        ITextTarget *find(std::string_view name) const;

        // Sets the text when the target exists. Returns whether it was published.
        bool publish(std::string_view name, std::string_view text) const;

        size_t size() const { return _targets.size(); }

    private:
        std::unordered_map<std::string, ITextTarget *> _targets;
    };

    // Logs every update through Logger; remembers the last value.
    class ConsoleTextTarget : public ITextTarget
    {
    public:
        explicit ConsoleTextTarget(std::string label) : _label(std::move(label)) {}

        void set_text(std::string_view text) override;

        const std::string &text() const { return _text; }
        const std::string &label() const { return _label; }

    private:
        std::string _label;
        std::string _text;
    };
} // namespace OrbitView
