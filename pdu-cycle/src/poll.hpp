/**
 * Copyright © 2025 IBM Corporation
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */
#pragma once

#include <chrono>

namespace pdu_cycle
{

/**
 * Repeatedly evaluates a probe until it returns the target value or the
 * timeout budget is exhausted.
 *
 * Each iteration evaluates the probe.  If the value equals the target, true is
 * returned immediately without sleeping.  Otherwise one interval is deducted
 * from the remaining budget.  If the remaining budget is still >= 0 the
 * function sleeps one interval and evaluates the probe again; if it is
 * negative, false is returned.
 *
 * The probe is therefore evaluated (timeout / interval) + 1 times when the
 * target is never reached.  The last evaluation happens after the whole
 * budget has been slept, so a value that changes exactly at the deadline is
 * still observed.
 *
 * Exceptions thrown by the probe or the sleep function are not caught.
 *
 * @param probe function with no parameters that returns the current value
 * @param target value to wait for
 * @param interval time to sleep between probe evaluations
 * @param timeout total time budget
 * @param sleep function called to sleep for one interval
 * @return true if the probe returned the target value, false on timeout
 */
template <typename Probe, typename T, typename Sleep>
bool pollWithTimeout(Probe&& probe, const T& target,
                     std::chrono::seconds interval,
                     std::chrono::seconds timeout, Sleep&& sleep)
{
    std::chrono::seconds remaining{timeout};
    while (true)
    {
        if (probe() == target)
        {
            return true;
        }

        remaining -= interval;
        if (remaining < std::chrono::seconds{0})
        {
            return false;
        }
        sleep(interval);
    }
}

} // namespace pdu_cycle
