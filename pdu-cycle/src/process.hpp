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

#include <string>
#include <vector>

/**
 * @namespace process
 *
 * Contains functions for running external programs.
 */
namespace pdu_cycle::process
{

/**
 * @struct Result
 *
 * Result of running an external program to completion.
 */
struct Result
{
    /**
     * Exit code of the program.
     */
    int exitCode{0};

    /**
     * Text the program wrote to standard output.
     */
    std::string output{};

    /**
     * Text the program wrote to standard error.
     */
    std::string errorOutput{};
};

/**
 * Runs the specified program and waits for it to exit.
 *
 * If the program name does not contain a '/', it is searched for in the
 * directories listed in the PATH environment variable.
 *
 * Throws a runtime_error if the program cannot be found or started.
 *
 * @param program program name or path
 * @param args command line arguments, not including the program name
 * @return exit code and output of the program
 */
Result run(const std::string& program, const std::vector<std::string>& args);

} // namespace pdu_cycle::process
