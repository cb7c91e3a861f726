#include "landlord/ScoreTriple.hh"

#include <algorithm>
#include <functional>
#include <numeric>

namespace Landlord {

namespace {

template<typename BinaryOperation>
ScoreTriple combine(
    const ScoreTriple& lhs, const ScoreTriple& rhs, BinaryOperation op)
{
    auto ret = ScoreTriple {};
    for (const auto seat : SEATS) {
        ret[seat] = op(lhs[seat], rhs[seat]);
    }
    return ret;
}

}

ScoreTriple operator+(const ScoreTriple& lhs, const ScoreTriple& rhs)
{
    return combine(lhs, rhs, std::plus<int> {});
}

int scoreSum(const ScoreTriple& scores)
{
    return std::accumulate(scores.begin(), scores.end(), 0);
}

ScoreTriple elementwiseMax(const ScoreTriple& lhs, const ScoreTriple& rhs)
{
    return combine(
        lhs, rhs, [](const auto a, const auto b) { return std::max(a, b); });
}

ScoreTriple elementwiseMin(const ScoreTriple& lhs, const ScoreTriple& rhs)
{
    return combine(
        lhs, rhs, [](const auto a, const auto b) { return std::min(a, b); });
}

}
