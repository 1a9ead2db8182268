#include "trail_buffer.h"

#include <stdexcept>

namespace OrbitView
{
    namespace
    {
        // Validated before the storage is sized so capacity * 3 cannot wrap.
        size_t checked_capacity(size_t capacity)
        {
            if (capacity == 0)
            {
                throw std::invalid_argument("TrailBuffer capacity must be at least 1");
            }
            if (capacity > std::vector<float>().max_size() / 3)
            {
                throw std::invalid_argument("TrailBuffer capacity is too large");
            }
            return capacity;
        }
    } // namespace

    TrailBuffer::TrailBuffer(size_t capacity)
        : _vertices(checked_capacity(capacity) * 3, 0.0f)
        , _capacity(capacity)
    {
    }

    void TrailBuffer::record(const SceneVec3 &point)
    {
        float *slot = _vertices.data() + _cursor * 3;
        slot[0] = point.x;
        slot[1] = point.y;
        slot[2] = point.z;

        _cursor = (_cursor + 1) % _capacity;
        ++_recorded;
    }

    SceneVec3 TrailBuffer::point(size_t slot) const
    {
        const float *p = _vertices.data() + (slot % _capacity) * 3;
        return SceneVec3(p[0], p[1], p[2]);
    }
} // namespace OrbitView
