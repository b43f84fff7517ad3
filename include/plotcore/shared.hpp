#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <utility>
#include <vector>

namespace plotcore
{

namespace detail
{

// Change listeners of one Shared<T>. Held by shared_ptr so subscriptions can
// outlive the model they were taken on.
class ListenerSet
{
   public:
    using Id = uint64_t;

    Id add(std::function<void()> listener)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const Id                    id = next_id_++;
        listeners_.emplace_back(id, std::move(listener));
        return id;
    }

    void remove(Id id)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::erase_if(listeners_, [id](const auto& entry) { return entry.first == id; });
    }

    // Runs under the set's mutex, so remove() returns only once no call to
    // that listener is in flight.
    void notify()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : listeners_)
            entry.second();
    }

    size_t size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return listeners_.size();
    }

   private:
    mutable std::mutex                                mutex_;
    std::vector<std::pair<Id, std::function<void()>>> listeners_;
    Id                                                next_id_ = 1;
};

}   // namespace detail

// Keeps one change listener registered; destroying or resetting it
// unregisters. Safe in either destruction order with respect to the model.
class Subscription
{
   public:
    Subscription() = default;
    Subscription(std::weak_ptr<detail::ListenerSet> set, detail::ListenerSet::Id id)
        : set_(std::move(set)), id_(id)
    {
    }

    Subscription(Subscription&& other) noexcept
        : set_(std::move(other.set_)), id_(std::exchange(other.id_, 0))
    {
    }

    Subscription& operator=(Subscription&& other) noexcept
    {
        if (this != &other)
        {
            reset();
            set_ = std::move(other.set_);
            id_  = std::exchange(other.id_, 0);
        }
        return *this;
    }

    Subscription(const Subscription&)            = delete;
    Subscription& operator=(const Subscription&) = delete;

    ~Subscription() { reset(); }

    void reset()
    {
        if (id_ == 0)
            return;
        if (auto set = set_.lock())
            set->remove(id_);
        set_.reset();
        id_ = 0;
    }

    bool active() const { return id_ != 0 && !set_.expired(); }

   private:
    std::weak_ptr<detail::ListenerSet> set_;
    detail::ListenerSet::Id            id_ = 0;
};

// Owns a value behind a reader/writer lock.
//
// Any number of render passes may hold a ReadGuard at once; mutation takes a
// WriteGuard and is exclusive. Keep write sections short: clear-and-rebuild
// of a figure, or a single bounds replacement on an axes model.
//
// Change listeners run each time a WriteGuard is released, after the data
// lock has been dropped. They are meant for "request another frame"
// notifications, must not throw, and must not subscribe or unsubscribe on
// the same model.
template <typename T>
class Shared
{
   public:
    class ReadGuard
    {
       public:
        explicit ReadGuard(const Shared& owner) : lock_(owner.mutex_), value_(&owner.value_) {}

        const T& operator*() const { return *value_; }
        const T* operator->() const { return value_; }

       private:
        std::shared_lock<std::shared_mutex> lock_;
        const T*                            value_;
    };

    class WriteGuard
    {
       public:
        explicit WriteGuard(Shared& owner) : owner_(&owner), lock_(owner.mutex_) {}

        WriteGuard(WriteGuard&&) noexcept            = default;
        WriteGuard& operator=(WriteGuard&&) noexcept = delete;
        WriteGuard(const WriteGuard&)                = delete;
        WriteGuard& operator=(const WriteGuard&)     = delete;

        ~WriteGuard()
        {
            if (lock_.owns_lock())
            {
                lock_.unlock();
                owner_->notify_changed();
            }
        }

        T& operator*() const { return owner_->value_; }
        T* operator->() const { return &owner_->value_; }

       private:
        Shared*                             owner_;
        std::unique_lock<std::shared_mutex> lock_;
    };

    template <typename... Args>
    explicit Shared(std::in_place_t, Args&&... args) : value_(std::forward<Args>(args)...)
    {
    }

    explicit Shared(T value) : value_(std::move(value)) {}

    Shared(const Shared&)            = delete;
    Shared& operator=(const Shared&) = delete;

    ReadGuard  read() const { return ReadGuard(*this); }
    WriteGuard write() { return WriteGuard(*this); }

    // The listener stays registered for as long as the returned
    // Subscription lives.
    [[nodiscard]] Subscription on_change(std::function<void()> listener)
    {
        return Subscription(listeners_, listeners_->add(std::move(listener)));
    }

    size_t listener_count() const { return listeners_->size(); }

   private:
    void notify_changed() { listeners_->notify(); }

    mutable std::shared_mutex mutex_;
    T                         value_;

    std::shared_ptr<detail::ListenerSet> listeners_ = std::make_shared<detail::ListenerSet>();
};

template <typename T, typename... Args>
std::shared_ptr<Shared<T>> make_shared_model(Args&&... args)
{
    return std::make_shared<Shared<T>>(std::in_place, std::forward<Args>(args)...);
}

}   // namespace plotcore
