// Ticket: 0006_contact_active_set

#include "mbs-sim/src/Physics/Integration/ActiveSet.hpp"

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace mbs_sim
{

std::string_view toString(ContactMode mode)
{
  switch (mode)
  {
    case ContactMode::Inactive:
      return "Inactive";
    case ContactMode::CandidateOnly:
      return "CandidateOnly";
    case ContactMode::Persistent:
      return "Persistent";
    case ContactMode::Smooth:
      return "Smooth";
  }
  return "Unknown";
}

std::vector<ContactMode> classifyContacts(const Eigen::VectorXd& proxR,
                                          const ContactQuantities& quantities)
{
  const auto n = proxR.size();
  const auto& c = quantities;
  if (c.gN.size() != n || c.kappaHatN.size() != n || c.xiN.size() != n ||
      c.PN.size() != n || c.gNDDot.size() != n || c.laN.size() != n)
  {
    throw std::invalid_argument(
      "classifyContacts: all quantities must have size " + std::to_string(n));
  }

  std::vector<ContactMode> modes(static_cast<std::size_t>(n),
                                 ContactMode::Inactive);
  for (Eigen::Index i = 0; i < n; ++i)
  {
    const double r = proxR(i);
    auto& mode = modes[static_cast<std::size_t>(i)];

    if (!(r * c.gN(i) - c.kappaHatN(i) <= 0.0))
    {
      continue;
    }
    mode = ContactMode::CandidateOnly;

    if (!(r * c.xiN(i) - c.PN(i) <= 0.0))
    {
      continue;
    }
    mode = ContactMode::Persistent;

    if (!(r * c.gNDDot(i) - c.laN(i) <= 0.0))
    {
      continue;
    }
    mode = ContactMode::Smooth;
  }
  return modes;
}

std::vector<ContactMode> widerModes(const std::vector<ContactMode>& a,
                                    const std::vector<ContactMode>& b)
{
  if (a.size() != b.size())
  {
    throw std::invalid_argument("widerModes: sizes " +
                                std::to_string(a.size()) + " and " +
                                std::to_string(b.size()) + " differ");
  }

  std::vector<ContactMode> wider(a.size());
  std::transform(a.begin(),
                 a.end(),
                 b.begin(),
                 wider.begin(),
                 [](ContactMode lhs, ContactMode rhs)
                 { return std::max(lhs, rhs); });
  return wider;
}

bool withinModes(const std::vector<ContactMode>& inner,
                 const std::vector<ContactMode>& outer)
{
  if (inner.size() != outer.size())
  {
    throw std::invalid_argument("withinModes: sizes " +
                                std::to_string(inner.size()) + " and " +
                                std::to_string(outer.size()) + " differ");
  }

  for (std::size_t i = 0; i < inner.size(); ++i)
  {
    if (inner[i] > outer[i])
    {
      return false;
    }
  }
  return true;
}

}  // namespace mbs_sim
