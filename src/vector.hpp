#pragma once
#include <cassert>
#include <cmath>
#include <cstddef>
#include <limits>
#include <new>
#include <stdexcept>
#include <utility>

// Contiguous growable buffer with a caller-chosen growth factor.
// Slots in [size(), capacity()) are raw storage; nothing lives there.
template <typename T>
class DynArray
{
public:
    explicit DynArray(double growth = 2.0)
        : data_(nullptr), size_(0), cap_(0), growth_(growth)
    {
        // also rejects NaN
        if (!(growth > 1.0) || !std::isfinite(growth))
            throw std::invalid_argument("DynArray: growth factor must be finite and > 1");
    }

    ~DynArray() { destroy_(); }

    // Keeps the source's capacity, not just its size.
    DynArray(const DynArray &o) : DynArray(o.growth_)
    {
        reserve(o.cap_);
        for (; size_ < o.size_; ++size_)
            new (data_ + size_) T(o.data_[size_]);
    }

    DynArray(DynArray &&o) noexcept
        : data_(o.data_), size_(o.size_), cap_(o.cap_), growth_(o.growth_)
    {
        o.data_ = nullptr;
        o.size_ = o.cap_ = 0;
    }

    DynArray &operator=(DynArray o) noexcept
    {
        swap(o);
        return *this;
    }

    void swap(DynArray &o) noexcept
    {
        std::swap(data_, o.data_);
        std::swap(size_, o.size_);
        std::swap(cap_, o.cap_);
        std::swap(growth_, o.growth_);
    }

    void reserve(std::size_t n)
    {
        if (n <= cap_)
            return;
        reallocate_(n);
    }

    void push_back(const T &v)
    {
        if (size_ == cap_)
        {
            // v may live inside this buffer
            T tmp(v);
            ensure_cap_(size_ + 1);
            new (data_ + size_) T(std::move(tmp));
        }
        else
        {
            new (data_ + size_) T(v);
        }
        ++size_;
    }
    void push_back(T &&v)
    {
        if (size_ == cap_)
        {
            T tmp(std::move(v));
            ensure_cap_(size_ + 1);
            new (data_ + size_) T(std::move(tmp));
        }
        else
        {
            new (data_ + size_) T(std::move(v));
        }
        ++size_;
    }

    template <class... Args>
    T &emplace_back(Args &&...args)
    {
        if (size_ == cap_)
        {
            T tmp(std::forward<Args>(args)...);
            ensure_cap_(size_ + 1);
            new (data_ + size_) T(std::move(tmp));
        }
        else
        {
            new (data_ + size_) T(std::forward<Args>(args)...);
        }
        return data_[size_++];
    }

    void pop_back()
    {
        assert(size_ > 0);
        data_[size_ - 1].~T();
        --size_;
    }

    T &back()
    {
        assert(size_ > 0);
        return data_[size_ - 1];
    }
    const T &back() const
    {
        assert(size_ > 0);
        return data_[size_ - 1];
    }

    // Capacity is retained.
    void clear()
    {
        for (std::size_t i = 0; i < size_; ++i)
            data_[i].~T();
        size_ = 0;
    }

    std::size_t size() const { return size_; }
    std::size_t capacity() const { return cap_; }
    bool empty() const { return size_ == 0; }
    double growth() const { return growth_; }

    T *begin() { return data_; }
    const T *begin() const { return data_; }
    T *end() { return data_ + size_; }
    const T *end() const { return data_ + size_; }

    T &operator[](std::size_t i)
    {
        assert(i < size_);
        return data_[i];
    }
    const T &operator[](std::size_t i) const
    {
        assert(i < size_);
        return data_[i];
    }

    T &at(std::size_t i)
    {
        if (i >= size_)
            throw std::out_of_range("DynArray::at");
        return data_[i];
    }
    const T &at(std::size_t i) const
    {
        if (i >= size_)
            throw std::out_of_range("DynArray::at");
        return data_[i];
    }

    // Largest slot count whose byte size fits in std::size_t.
    static constexpr std::size_t max_size() { return std::numeric_limits<std::size_t>::max() / sizeof(T); }

    // Capacity the next growth step would reach from cap, saturated at
    // max_size().
    std::size_t next_capacity(std::size_t cap) const
    {
        if (cap == 0)
            return 1;
        const std::size_t limit = max_size();
        if (cap >= limit)
            return limit;
        const double want = static_cast<double>(cap) * growth_;
        if (want >= static_cast<double>(limit))
            return limit;
        std::size_t ncap = static_cast<std::size_t>(want);
        // factors just above 1 must still make progress
        if (ncap <= cap)
            ncap = cap + 1;
        return ncap;
    }

private:
    void ensure_cap_(std::size_t need)
    {
        if (need <= cap_)
            return;
        std::size_t ncap = next_capacity(cap_);
        if (ncap < need)
            ncap = need;
        reallocate_(ncap);
    }

    void reallocate_(std::size_t ncap)
    {
        if (ncap > max_size())
            throw std::length_error("DynArray: capacity exceeds max_size()");
        T *ndata = static_cast<T *>(::operator new[](ncap * sizeof(T), std::align_val_t(alignof(T))));
        std::size_t moved = 0;
        try
        {
            for (; moved < size_; ++moved)
                new (ndata + moved) T(std::move_if_noexcept(data_[moved]));
        }
        catch (...)
        {
            for (std::size_t i = 0; i < moved; ++i)
                ndata[i].~T();
            ::operator delete[](ndata, std::align_val_t(alignof(T)));
            throw;
        }
        for (std::size_t i = 0; i < size_; ++i)
            data_[i].~T();
        if (data_)
            ::operator delete[](data_, std::align_val_t(alignof(T)));
        data_ = ndata;
        cap_ = ncap;
    }

    void destroy_()
    {
        if (!data_)
            return;
        for (std::size_t i = 0; i < size_; ++i)
            data_[i].~T();
        ::operator delete[](data_, std::align_val_t(alignof(T)));
        data_ = nullptr;
        size_ = cap_ = 0;
    }

    T *data_;
    std::size_t size_, cap_;
    double growth_;
};
