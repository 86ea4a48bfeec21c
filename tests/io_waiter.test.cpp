// Copyright 2026 The libh7spi Authors
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include <libh7spi/io_waiter.hpp>

#include <boost/ut.hpp>

namespace h7spi {
namespace {
class counting_waiter : public io_waiter
{
public:
  int m_waits = 0;
  int m_resumes = 0;

private:
  void driver_wait() override
  {
    m_waits++;
  }

  void driver_resume() noexcept override
  {
    m_resumes++;
  }
};
}  // namespace

boost::ut::suite<"io_waiter_test"> io_waiter_test = []() {
  using namespace boost::ut;

  "polling io_waiter returns immediately"_test = []() {
    // Setup
    io_waiter& waiter = polling_io_waiter();

    // Exercise + Verify
    expect(nothrow([&] {
      waiter.wait();
      waiter.resume();
    }));
    expect(&waiter == &polling_io_waiter());
  };

  "wait() and resume() reach the implementation"_test = []() {
    // Setup
    counting_waiter waiter;
    io_waiter& base = waiter;

    // Exercise
    base.wait();
    base.wait();
    base.resume();

    // Verify
    expect(that % 2 == waiter.m_waits);
    expect(that % 1 == waiter.m_resumes);
  };
};
}  // namespace h7spi
