#pragma once

// In-memory scene used when no GPU backend is attached: nodes, trail lines and a
// point light that only store what the render loop writes into them.

#include "scene_interfaces.h"
#include <core/config.h>

#include <glm/vec4.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace OrbitView
{
    class HeadlessNode : public ISceneNode
    {
    public:
        explicit HeadlessNode(std::string name) : _name(std::move(name)) {}

        void set_position(float x, float y, float z) override { _position = SceneVec3(x, y, z); }
        SceneVec3 position() const override { return _position; }

        void set_rotation(Axis axis, float value) override { _rotation[static_cast<int>(axis)] = value; }
        float rotation(Axis axis) const override { return _rotation[static_cast<int>(axis)]; }

        void set_scale(float x, float y, float z) override { _scale = SceneVec3(x, y, z); }
        SceneVec3 scale() const override { return _scale; }

        const std::string &name() const { return _name; }

        using ISceneNode::set_position;

    private:
        std::string _name;
        SceneVec3 _position{0.0f};
        SceneVec3 _rotation{0.0f};
        SceneVec3 _scale{1.0f};
    };

    class HeadlessLine : public IRenderableLine
    {
    public:
        HeadlessLine(std::string name, const glm::vec4 &color)
            : _name(std::move(name))
            , _color(color)
        {
        }

        void set_vertex_buffer(std::span<const float> vertices) override;
        void mark_dirty() override { _dirty = true; }

        // Consumes the dirty flag as a backend would on upload. Returns whether it was set.
        bool upload();

        const std::vector<float> &vertices() const { return _vertices; }
        size_t vertex_count() const { return _vertices.size() / 3; }
        bool dirty() const { return _dirty; }
        uint64_t upload_count() const { return _upload_count; }
        const glm::vec4 &color() const { return _color; }
        const std::string &name() const { return _name; }

    private:
        std::string _name;
        glm::vec4 _color{1.0f};
        std::vector<float> _vertices;
        bool _dirty{false};
        uint64_t _upload_count{0};
    };

    class HeadlessLight : public IPointLight
    {
    public:
        void set_position(const SceneVec3 &p) override { _position = p; }
        SceneVec3 position() const { return _position; }

    private:
        SceneVec3 _position{0.0f};
    };

    class HeadlessScene
    {
    public:
        HeadlessNode &create_node(const std::string &name);
        HeadlessLine &create_line(const std::string &name, const glm::vec4 &color);

        HeadlessNode *find_node(std::string_view name);
        HeadlessLine *find_line(std::string_view name);

        HeadlessLight &light() { return _light; }
        const HeadlessLight &light() const { return _light; }

        const std::vector<std::unique_ptr<HeadlessNode>> &nodes() const { return _nodes; }
        const std::vector<std::unique_ptr<HeadlessLine>> &lines() const { return _lines; }

    private:
        std::vector<std::unique_ptr<HeadlessNode>> _nodes;
        std::vector<std::unique_ptr<HeadlessLine>> _lines;
        HeadlessLight _light;
    };

    // Stands in for the GPU renderer: uploads dirty lines and logs a scene summary
    // every `summary_every_n_frames` frames (0 disables the summary).
    class ConsoleRenderer : public IRenderer
    {
    public:
        explicit ConsoleRenderer(HeadlessScene &scene, uint64_t summary_every_n_frames = kDefaultSummaryEveryNFrames)
            : _scene(scene)
            , _summary_every(summary_every_n_frames)
        {
        }

        void render() override;

        uint64_t frame_count() const { return _frame_count; }
        uint64_t line_uploads() const { return _line_uploads; }

    private:
        void log_summary() const;

        HeadlessScene &_scene;
        uint64_t _summary_every{0};
        uint64_t _frame_count{0};
        uint64_t _line_uploads{0};
    };
} // namespace OrbitView
