#include "headless_scene.h"
#include "core/util/logger.h"

namespace OrbitView
{
    // ---- HeadlessLine ----

    void HeadlessLine::set_vertex_buffer(std::span<const float> vertices)
    {
        _vertices.assign(vertices.begin(), vertices.end());
    }

    bool HeadlessLine::upload()
    {
        if (!_dirty)
        {
            return false;
        }
        _dirty = false;
        ++_upload_count;
        return true;
    }

    // ---- HeadlessScene ----

    HeadlessNode &HeadlessScene::create_node(const std::string &name)
    {
        _nodes.push_back(std::make_unique<HeadlessNode>(name));
        return *_nodes.back();
    }

    HeadlessLine &HeadlessScene::create_line(const std::string &name, const glm::vec4 &color)
    {
        _lines.push_back(std::make_unique<HeadlessLine>(name, color));
        return *_lines.back();
    }

    HeadlessNode *HeadlessScene::find_node(std::string_view name)
    {
        for (auto &n : _nodes)
        {
            if (n->name() == name)
            {
                return n.get();
            }
        }
        return nullptr;
    }

    HeadlessLine *HeadlessScene::find_line(std::string_view name)
    {
        for (auto &l : _lines)
        {
            if (l->name() == name)
            {
                return l.get();
            }
        }
        return nullptr;
    }

    // ---- ConsoleRenderer ----

    void ConsoleRenderer::render()
    {
        for (auto &line : _scene.lines())
        {
            if (line->upload())
            {
                ++_line_uploads;
            }
        }

        ++_frame_count;
        if (_summary_every > 0 && _frame_count % _summary_every == 0)
        {
            log_summary();
        }
    }

    void ConsoleRenderer::log_summary() const
    {
        Logger::info("[Render] frame {} | {} nodes | {} lines | {} line uploads",
                     _frame_count, _scene.nodes().size(), _scene.lines().size(), _line_uploads);

        for (const auto &node : _scene.nodes())
        {
            const SceneVec3 p = node->position();
            Logger::debug("[Render]   {:<8} pos=({:.3f}, {:.3f}, {:.3f}) rotY={:.2f}",
                          node->name(), p.x, p.y, p.z, node->rotation(Axis::Y));
        }
    }
} // namespace OrbitView
