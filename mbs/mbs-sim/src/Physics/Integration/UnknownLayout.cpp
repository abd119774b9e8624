// Ticket: 0001_generalized_alpha_dae

#include "mbs-sim/src/Physics/Integration/UnknownLayout.hpp"

#include <stdexcept>
#include <string>

namespace mbs_sim
{

namespace
{

template <std::size_t N>
Eigen::Index assignConsecutive(std::array<Segment, N>& segments,
                               const std::array<Eigen::Index, N>& sizes)
{
  Eigen::Index offset = 0;
  for (std::size_t i = 0; i < N; ++i)
  {
    segments[i] = Segment{offset, sizes[i]};
    offset += sizes[i];
  }
  return offset;
}

}  // namespace

UnknownLayout::UnknownLayout(int nq,
                             int nu,
                             int nlaG,
                             int nlaGamma,
                             int nlaN,
                             DAEIndex index,
                             bool useGGL)
  : nq_{nq},
    nu_{nu},
    nla_g_{nlaG},
    nla_gamma_{nlaGamma},
    nla_n_{nlaN},
    index_{index},
    use_ggl_{useGGL}
{
  if (nq < 1 || nu < 1)
  {
    throw std::invalid_argument(
      "UnknownLayout: nq and nu must be positive, got nq=" +
      std::to_string(nq) + " nu=" + std::to_string(nu));
  }
  if (nlaG < 0 || nlaGamma < 0 || nlaN < 0)
  {
    throw std::invalid_argument(
      "UnknownLayout: multiplier counts must be non-negative");
  }
  if (useGGL && index == DAEIndex::Three)
  {
    throw std::invalid_argument(
      "UnknownLayout: GGL stabilization requires DAE index 1 or 2");
  }

  const bool fullGGL = useGGL && index == DAEIndex::One;

  const Eigen::Index kappaG = useGGL ? nlaG : 0;
  const Eigen::Index LaG = fullGGL ? nlaG : 0;
  const Eigen::Index LaGamma = fullGGL ? nlaGamma : 0;

  blocks_ = {};
  size_ = assignConsecutive(
    blocks_,
    std::array<Eigen::Index, kBlockCount>{
      nq, nu, kappaG, LaG, nlaG, LaGamma, nlaGamma, nlaN, nlaN, nlaN});

  const Eigen::Index gPosition =
    (index == DAEIndex::Three || useGGL) ? nlaG : 0;
  const Eigen::Index gVelocity =
    (index == DAEIndex::Two || fullGGL) ? nlaG : 0;
  const Eigen::Index gAcceleration = index == DAEIndex::One ? nlaG : 0;
  const Eigen::Index gammaVelocity =
    (index != DAEIndex::One || fullGGL) ? nlaGamma : 0;
  const Eigen::Index gammaAcceleration =
    index == DAEIndex::One ? nlaGamma : 0;

  const Eigen::Index rowCount = assignConsecutive(
    equations_,
    std::array<Eigen::Index, kEquationCount>{nq,
                                             nu,
                                             gPosition,
                                             gVelocity,
                                             gAcceleration,
                                             gammaVelocity,
                                             gammaAcceleration,
                                             nlaN,
                                             nlaN,
                                             nlaN});

  if (rowCount != size_)
  {
    throw std::logic_error("UnknownLayout: residual has " +
                           std::to_string(rowCount) + " rows for " +
                           std::to_string(size_) + " unknowns");
  }
}

Segment UnknownLayout::segment(Block block) const
{
  return blocks_.at(static_cast<std::size_t>(block));
}

Segment UnknownLayout::rows(Equation equation) const
{
  return equations_.at(static_cast<std::size_t>(equation));
}

bool UnknownLayout::hasVelocityJump() const
{
  return segment(Block::CapitalLambdaG).size > 0 ||
         segment(Block::CapitalLambdaGamma).size > 0 ||
         segment(Block::CapitalLambdaN).size > 0;
}

Eigen::VectorXd UnknownLayout::pack(const Unknowns& unknowns) const
{
  Eigen::VectorXd x(size_);

  auto place = [&](Block block, const Eigen::VectorXd& value, const char* name)
  {
    const Segment s = segment(block);
    if (value.size() != s.size)
    {
      throw std::invalid_argument(std::string{"UnknownLayout::pack: "} + name +
                                  " has size " + std::to_string(value.size()) +
                                  ", expected " + std::to_string(s.size));
    }
    x.segment(s.offset, s.size) = value;
  };

  place(Block::QDot, unknowns.qDot, "qDot");
  place(Block::UDot, unknowns.uDot, "uDot");
  place(Block::KappaG, unknowns.kappaG, "kappaG");
  place(Block::CapitalLambdaG, unknowns.LaG, "LaG");
  place(Block::LambdaG, unknowns.laG, "laG");
  place(Block::CapitalLambdaGamma, unknowns.LaGamma, "LaGamma");
  place(Block::LambdaGamma, unknowns.laGamma, "laGamma");
  place(Block::KappaN, unknowns.kappaN, "kappaN");
  place(Block::CapitalLambdaN, unknowns.LaN, "LaN");
  place(Block::LambdaN, unknowns.laN, "laN");
  return x;
}

Unknowns UnknownLayout::unpack(const Eigen::VectorXd& x) const
{
  if (x.size() != size_)
  {
    throw std::invalid_argument("UnknownLayout::unpack: x has size " +
                                std::to_string(x.size()) + ", expected " +
                                std::to_string(size_));
  }

  auto take = [&](Block block) -> Eigen::VectorXd
  {
    const Segment s = segment(block);
    return x.segment(s.offset, s.size);
  };

  Unknowns unknowns;
  unknowns.qDot = take(Block::QDot);
  unknowns.uDot = take(Block::UDot);
  unknowns.kappaG = take(Block::KappaG);
  unknowns.LaG = take(Block::CapitalLambdaG);
  unknowns.laG = take(Block::LambdaG);
  unknowns.LaGamma = take(Block::CapitalLambdaGamma);
  unknowns.laGamma = take(Block::LambdaGamma);
  unknowns.kappaN = take(Block::KappaN);
  unknowns.LaN = take(Block::CapitalLambdaN);
  unknowns.laN = take(Block::LambdaN);
  return unknowns;
}

}  // namespace mbs_sim
