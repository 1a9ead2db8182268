#pragma once

// Collaborators the render loop drives. Meshes, materials, cameras and windows live
// behind these; the loop only positions, rotates, scales and uploads.

#include <core/world.h>

#include <cstdint>
#include <span>

namespace OrbitView
{
    enum class Axis : uint8_t
    {
        X = 0,
        Y = 1,
        Z = 2,
    };

    class ISceneNode
    {
    public:
        virtual ~ISceneNode() = default;

        virtual void set_position(float x, float y, float z) = 0;
        virtual SceneVec3 position() const = 0;

        // Euler angle (radians) about one axis.
        virtual void set_rotation(Axis axis, float value) = 0;
        virtual float rotation(Axis axis) const = 0;

        virtual void set_scale(float x, float y, float z) = 0;
        virtual SceneVec3 scale() const = 0;

        void set_position(const SceneVec3 &p) { set_position(p.x, p.y, p.z); }
    };

    // A polyline whose vertex buffer is replaced wholesale and re-uploaded on demand.
    class IRenderableLine
    {
    public:
        virtual ~IRenderableLine() = default;

        // Flat x,y,z triples.
        virtual void set_vertex_buffer(std::span<const float> vertices) = 0;

        // Request a GPU re-upload of the vertex buffer before the next draw.
        virtual void mark_dirty() = 0;
    };

    class IPointLight
    {
    public:
        virtual ~IPointLight() = default;

        virtual void set_position(const SceneVec3 &p) = 0;
    };

    class IRenderer
    {
    public:
        virtual ~IRenderer() = default;

        // Draw the current scene through the current camera.
        virtual void render() = 0;
    };
} // namespace OrbitView
