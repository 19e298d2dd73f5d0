#include "rg/core/types/GridStats.hpp"
#include "rg/core/types/Grid.hpp"

#include <nlohmann/json.hpp>

namespace rg {

template<typename T>
GridStats<T>::GridStats(Grid<T>& grid, StatsMode mode)
    : _grid(grid), _mode(mode)
{
}

template<typename T>
void GridStats<T>::setMode(StatsMode mode)
{
    _mode = mode;
}

template<typename T>
void GridStats<T>::apply(T newValue, T oldValue)
{
    if (newValue == oldValue)
        return;
    if (_mode == StatsMode::Stale || !_upToDate) {
        _upToDate = false;
        return;
    }

    const T nd = _grid.noData();
    if (oldValue != nd) {
        --_count;
        _sum -= toDecimal(oldValue);
        if (!_minStale && _min && oldValue == *_min && --_nMin == 0)
            _minStale = true;
        if (!_maxStale && _max && oldValue == *_max && --_nMax == 0)
            _maxStale = true;
    }

    if (newValue != nd) {
        ++_count;
        _sum += toDecimal(newValue);

        if (_minStale) {
            // Every remaining value is above the vanished minimum.
            if (newValue <= *_min) {
                _min = newValue;
                _nMin = 1;
                _minStale = false;
            }
        } else if (!_min || newValue < *_min) {
            _min = newValue;
            _nMin = 1;
        } else if (newValue == *_min) {
            ++_nMin;
        }

        if (_maxStale) {
            if (newValue >= *_max) {
                _max = newValue;
                _nMax = 1;
                _maxStale = false;
            }
        } else if (!_max || newValue > *_max) {
            _max = newValue;
            _nMax = 1;
        } else if (newValue == *_max) {
            ++_nMax;
        }
    }

    if (_count == 0) {
        _min.reset();
        _max.reset();
        _nMin = _nMax = 0;
        _minStale = _maxStale = false;
    }
}

template<typename T>
void GridStats<T>::ensureFresh()
{
    if (!_upToDate)
        update();
}

template<typename T>
std::int64_t GridStats<T>::count()
{
    ensureFresh();
    return _count;
}

template<typename T>
Decimal GridStats<T>::sum()
{
    ensureFresh();
    return _sum;
}

template<typename T>
std::optional<T> GridStats<T>::min()
{
    ensureFresh();
    if (_minStale)
        rescanExtremes();
    return _min;
}

template<typename T>
std::optional<T> GridStats<T>::max()
{
    ensureFresh();
    if (_maxStale)
        rescanExtremes();
    return _max;
}

template<typename T>
std::int64_t GridStats<T>::nMin()
{
    min();
    return _nMin;
}

template<typename T>
std::int64_t GridStats<T>::nMax()
{
    max();
    return _nMax;
}

template<typename T>
std::optional<Decimal> GridStats<T>::mean(int dp, RoundingMode rm)
{
    ensureFresh();
    if (_count == 0)
        return std::nullopt;
    return roundTo(_sum / Decimal(_count), dp, rm);
}

template<typename T>
void GridStats<T>::update()
{
    const T nd = _grid.noData();
    std::int64_t count = 0;
    Decimal sum = 0;
    std::optional<T> mn, mx;
    std::int64_t nMin = 0, nMax = 0;

    _grid.forEachValueRun([&](T v, std::int64_t n) {
        if (v == nd)
            return;
        count += n;
        sum += toDecimal(v) * n;
        if (!mn || v < *mn) { mn = v; nMin = n; }
        else if (v == *mn) { nMin += n; }
        if (!mx || v > *mx) { mx = v; nMax = n; }
        else if (v == *mx) { nMax += n; }
    });

    _count = count;
    _sum = sum;
    _min = mn;
    _max = mx;
    _nMin = nMin;
    _nMax = nMax;
    _minStale = _maxStale = false;
    _upToDate = true;
}

template<typename T>
void GridStats<T>::rescanExtremes()
{
    const T nd = _grid.noData();
    std::optional<T> mn, mx;
    std::int64_t nMin = 0, nMax = 0;

    _grid.forEachValueRun([&](T v, std::int64_t n) {
        if (v == nd)
            return;
        if (!mn || v < *mn) { mn = v; nMin = n; }
        else if (v == *mn) { nMin += n; }
        if (!mx || v > *mx) { mx = v; nMax = n; }
        else if (v == *mx) { nMax += n; }
    });

    _min = mn;
    _max = mx;
    _nMin = nMin;
    _nMax = nMax;
    _minStale = _maxStale = false;
}

template<typename T>
nlohmann::json GridStats<T>::toJson()
{
    nlohmann::json j;
    j["count"] = count();
    j["sum"] = toString(sum());
    auto mn = min();
    auto mx = max();
    j["min"] = mn ? nlohmann::json(*mn) : nlohmann::json(nullptr);
    j["max"] = mx ? nlohmann::json(*mx) : nlohmann::json(nullptr);
    j["n_min"] = _nMin;
    j["n_max"] = _nMax;
    auto m = mean(10, RoundingMode::HalfEven);
    j["mean"] = m ? nlohmann::json(toString(*m)) : nlohmann::json(nullptr);
    j["mode"] = statsModeName(_mode);
    return j;
}

template class GridStats<std::int32_t>;
template class GridStats<float>;
template class GridStats<double>;

} // namespace rg
