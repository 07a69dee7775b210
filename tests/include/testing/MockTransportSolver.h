/// \file testing/MockTransportSolver.h
/// \brief Mock TransportSolver

#ifndef MOCK_TRANSPORT_SOLVER_H_
#define MOCK_TRANSPORT_SOLVER_H_

#include "gmock/gmock.h"
#include "soltran/TransportSolver.h"

namespace soltran
{

class MockTransportSolver : public TransportSolver {
 public:

  MOCK_METHOD2(query, SolverResult(const RegionGrid &, bool));

};

} // namespace soltran

#endif  // MOCK_TRANSPORT_SOLVER_H_
