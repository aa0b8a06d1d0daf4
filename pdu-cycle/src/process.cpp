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

#include "process.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/process.hpp>

#include <format>
#include <future>
#include <stdexcept>

namespace bp = boost::process;

namespace pdu_cycle::process
{

Result run(const std::string& program, const std::vector<std::string>& args)
{
    boost::filesystem::path executable{program};
    if (program.find('/') == std::string::npos)
    {
        executable = bp::search_path(program);
        if (executable.empty())
        {
            throw std::runtime_error{
                std::format("Program not found in PATH: {}", program)};
        }
    }

    Result result{};
    try
    {
        // stdout and stderr are drained concurrently by the io_context
        boost::asio::io_context ios;
        std::future<std::string> output, errorOutput;
        bp::child child{executable,          bp::args(args),
                        bp::std_in.close(),  bp::std_out > output,
                        bp::std_err > errorOutput, ios};

        ios.run();
        child.wait();

        result.exitCode = child.exit_code();
        result.output = output.get();
        result.errorOutput = errorOutput.get();
    }
    catch (const bp::process_error& e)
    {
        throw std::runtime_error{std::format("Unable to run {}: {}",
                                             executable.string(), e.what())};
    }
    return result;
}

} // namespace pdu_cycle::process
