#pragma once

// Recording doubles for the render loop's collaborators.

#include "physics/physics_stepper.h"
#include "scene/scene_interfaces.h"
#include "core/text/text_targets.h"

#include <functional>
#include <string>
#include <vector>

namespace OrbitView::Testing
{
    // Moves every body by a fixed displacement per step.
    class ScriptedStepper : public IPhysicsStepper
    {
    public:
        explicit ScriptedStepper(std::vector<Body> bodies, double dt_s = 864000.0)
            : _bodies(std::move(bodies))
            , _dt(dt_s)
        {
        }

        void step() override
        {
            ++steps;
            for (Body &b : _bodies)
            {
                b.position_m += displacement_per_step;
            }
        }

        double dt() const override { return _dt; }
        void set_dt(double dt_s) override { _dt = dt_s; }

        std::vector<Body> &bodies() override { return _bodies; }
        const std::vector<Body> &bodies() const override { return _bodies; }

        int steps{0};
        PhysicsVec2 displacement_per_step{0.0, 0.0};

    private:
        std::vector<Body> _bodies;
        double _dt;
    };

    class RecordingNode : public ISceneNode
    {
    public:
        void set_position(float x, float y, float z) override
        {
            _position = SceneVec3(x, y, z);
            ++position_writes;
        }
        SceneVec3 position() const override { return _position; }

        void set_rotation(Axis axis, float value) override { _rotation[static_cast<int>(axis)] = value; }
        float rotation(Axis axis) const override { return _rotation[static_cast<int>(axis)]; }

        void set_scale(float x, float y, float z) override { _scale = SceneVec3(x, y, z); }
        SceneVec3 scale() const override { return _scale; }

        using ISceneNode::set_position;

        int position_writes{0};

    private:
        SceneVec3 _position{0.0f};
        SceneVec3 _rotation{0.0f};
        SceneVec3 _scale{1.0f};
    };

    class RecordingLine : public IRenderableLine
    {
    public:
        void set_vertex_buffer(std::span<const float> v) override { vertices.assign(v.begin(), v.end()); }
        void mark_dirty() override { ++dirty_marks; }

        std::vector<float> vertices;
        int dirty_marks{0};
    };

    class RecordingLight : public IPointLight
    {
    public:
        void set_position(const SceneVec3 &p) override
        {
            position = p;
            ++moves;
        }

        SceneVec3 position{0.0f};
        int moves{0};
    };

    class RecordingRenderer : public IRenderer
    {
    public:
        void render() override
        {
            ++frames;
            if (on_render)
            {
                on_render();
            }
        }

        int frames{0};
        std::function<void()> on_render;
    };

    class RecordingTextTarget : public ITextTarget
    {
    public:
        void set_text(std::string_view t) override
        {
            text.assign(t.begin(), t.end());
            ++updates;
        }

        std::string text;
        int updates{0};
    };

    inline Body make_test_body(const std::string &id, const PhysicsVec2 &position_m,
                               const PhysicsVec2 &velocity_mps = PhysicsVec2(0.0))
    {
        Body b{};
        b.id = id;
        b.name = id;
        b.mass_kg = 1.0e24;
        b.position_m = position_m;
        b.velocity_mps = velocity_mps;
        b.radius_m = 1.0e6;
        return b;
    }
} // namespace OrbitView::Testing
