#include "buffer_lease.hpp"

#include <functional>
#include <iterator>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>

namespace mpart
{

    namespace
    {

        // Live leases keyed by range start, mapped to range end
        struct LeaseRegistry
        {
            std::mutex mutex;
            std::map<const char *, const char *> ranges;
        };

        LeaseRegistry &registry()
        {
            static LeaseRegistry instance;
            return instance;
        }

        // Caller holds the registry mutex
        bool overlaps(const std::map<const char *, const char *> &ranges,
                      const char *begin, const char *end)
        {
            std::less<const char *> before;
            auto next = ranges.lower_bound(begin);
            if (next != ranges.end() && before(next->first, end))
                return true;
            if (next != ranges.begin())
            {
                auto prev = std::prev(next);
                if (before(begin, prev->second))
                    return true;
            }
            return false;
        }

    } // anonymous namespace

    BufferLease::BufferLease(const char *name, const void *data, std::size_t bytes)
    {
        if (data == nullptr || bytes == 0)
            return;

        const char *begin = static_cast<const char *>(data);
        const char *end = begin + bytes;

        auto &reg = registry();
        std::lock_guard<std::mutex> lock(reg.mutex);
        if (overlaps(reg.ranges, begin, end))
        {
            throw std::logic_error(std::string(name) +
                                   " is already borrowed by another partition request");
        }
        reg.ranges.emplace(begin, end);
        begin_ = begin;
        end_ = end;
    }

    BufferLease::~BufferLease()
    {
        release();
    }

    BufferLease::BufferLease(BufferLease &&other) noexcept
        : begin_(other.begin_), end_(other.end_)
    {
        other.begin_ = nullptr;
        other.end_ = nullptr;
    }

    BufferLease &BufferLease::operator=(BufferLease &&other) noexcept
    {
        if (this != &other)
        {
            release();
            begin_ = other.begin_;
            end_ = other.end_;
            other.begin_ = nullptr;
            other.end_ = nullptr;
        }
        return *this;
    }

    bool BufferLease::isLeased(const void *data, std::size_t bytes)
    {
        if (data == nullptr || bytes == 0)
            return false;
        const char *begin = static_cast<const char *>(data);
        auto &reg = registry();
        std::lock_guard<std::mutex> lock(reg.mutex);
        return overlaps(reg.ranges, begin, begin + bytes);
    }

    void BufferLease::release() noexcept
    {
        if (begin_ == nullptr)
            return;
        auto &reg = registry();
        std::lock_guard<std::mutex> lock(reg.mutex);
        reg.ranges.erase(begin_);
        begin_ = nullptr;
        end_ = nullptr;
    }

} // namespace mpart
