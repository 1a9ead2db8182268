#include "text_targets.h"
#include "core/util/logger.h"

namespace OrbitView
{
    void TextTargets::add(const std::string &name, ITextTarget *target)
    {
        if (!target)
        {
            _targets.erase(name);
            return;
        }
        _targets[name] = target;
    }

    void TextTargets::remove(const std::string &name)
    {
        _targets.erase(name);
    }

    ITextTarget *TextTargets::find(std::string_view name) const
    {
        auto it = _targets.find(std::string(name));
        if (it == _targets.end())
        {
            return nullptr;
        }
        return it->second;
    }

    bool TextTargets::publish(std::string_view name, std::string_view text) const
    {
        ITextTarget *target = find(name);
        if (!target)
        {
            return false;
        }
        target->set_text(text);
        return true;
    }

    void ConsoleTextTarget::set_text(std::string_view text)
    {
        if (_text == text)
        {
            return;
        }
        _text.assign(text.begin(), text.end());
        Logger::debug("[{}] {}", _label, _text);
    }
} // namespace OrbitView
