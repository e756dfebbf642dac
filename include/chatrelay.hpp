/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file chatrelay.hpp
 * @brief chatrelay - multi-client TCP chat relay
 *
 * Thread-per-connection relay: every line a client sends is echoed back to
 * it and forwarded to every other connected client. A client leaves by
 * sending ":end".
 *
 * Usage:
 *   #include "chatrelay.hpp"
 *
 *   int main() {
 *     chatrelay::Server server(7000);
 *     server.run();
 *   }
 */

#ifndef CHATRELAY_HPP_
#define CHATRELAY_HPP_

#include "chatrelay/connection.hpp"
#include "chatrelay/connection_handler.hpp"
#include "chatrelay/connection_pool.hpp"
#include "chatrelay/log.hpp"
#include "chatrelay/server.hpp"
#include "chatrelay/utils.hpp"
#include "chatrelay/vocabulary.hpp"

#endif  // CHATRELAY_HPP_
