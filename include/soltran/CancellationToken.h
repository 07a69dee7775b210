/// \file CancellationToken.h
/// \brief A flag for stopping a run from outside.

#ifndef CANCELLATION_TOKEN_H_
#define CANCELLATION_TOKEN_H_

#include <atomic>
#include <memory>

namespace soltran
{

///---------------------------------------------------------------------
/// \class CancellationToken
/// \brief A flag which can be raised once, e.g. from a signal handler
///---------------------------------------------------------------------
class CancellationToken {

public:

  void cancel() noexcept { _cancelled.store(true); }
  bool isCancelled() const noexcept { return _cancelled.load(); }

private:

  std::atomic<bool> _cancelled {false};

};

using CancellationTokenPtr = std::shared_ptr<CancellationToken>;

} // namespace soltran

#endif  // CANCELLATION_TOKEN_H_
