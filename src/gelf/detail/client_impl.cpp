/* Flow-GELF: Client
 * Copyright 2023 Akamai Technologies, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */

/// @file
#include "gelf/detail/client_impl.hpp"
#include "gelf/transport/uri.hpp"
#include "gelf/error.hpp"
#include <flow/error/error.hpp>
#include <flow/util/util.hpp>

namespace gelf
{

Client::Impl::Impl(flow::log::Logger* logger_ptr, const Client_config& config, Error_code* err_code) :
  flow::log::Log_context(logger_ptr, Log_component::S_CLIENT),
  m_config(config),
  m_connected(false),
  m_n_sent_msgs(0),
  m_n_dropped_msgs(0)
{
  using flow::error::Runtime_error;
  using boost::movelib::make_unique;

  Error_code our_err_code;
  m_hostname = util::local_host_name(get_logger(), &our_err_code);
  if (!our_err_code)
  {
    if (m_config.m_frame_size <= transport::Chunk_encoder::S_HEADER_SIZE)
    {
      FLOW_LOG_WARNING("Client [" << this << "]: Frame size [" << m_config.m_frame_size << "] does not exceed the "
                       "GELF chunk header size [" << transport::Chunk_encoder::S_HEADER_SIZE << "].");
      our_err_code = error::Code::S_INVALID_FRAME_SIZE;
    }
    else if (m_config.m_intake_capacity == 0)
    {
      FLOW_LOG_WARNING("Client [" << this << "]: Intake capacity must be positive.");
      our_err_code = error::Code::S_INVALID_ARGUMENT;
    }
    else if ((m_config.m_compression != transport::Compression::S_NONE)
             && (m_config.m_compression != transport::Compression::S_GZIP)
             && (m_config.m_compression != transport::Compression::S_ZLIB))
    {
      FLOW_LOG_WARNING("Client [" << this << "]: Compression [" << m_config.m_compression << "] is not one of "
                       "NONE, GZIP, ZLIB.");
      our_err_code = error::Code::S_INVALID_ARGUMENT;
    }
    else if (m_config.m_idle_interval <= util::Fine_duration::zero())
    {
      // Dispatcher would spin instead of waiting while idle.
      FLOW_LOG_WARNING("Client [" << this << "]: Idle interval must be positive.");
      our_err_code = error::Code::S_INVALID_ARGUMENT;
    }
  }

  if (our_err_code)
  {
    if (err_code)
    {
      *err_code = our_err_code;
      return;
    }
    // else
    throw Runtime_error(our_err_code, FLOW_UTIL_WHERE_AM_I_STR());
  }
  // else

  m_intake = make_unique<Intake_channel>(m_config.m_intake_capacity);

  FLOW_LOG_INFO("Client [" << this << "]: Created with config [" << m_config << "]; local host name "
                "[" << m_hostname << "].");
  if (err_code)
  {
    err_code->clear();
  }
} // Client::Impl::Impl()

Client::Impl::~Impl()
{
  if (!m_connected)
  {
    FLOW_LOG_INFO("Client [" << this << "]: Shutting down (was not connected).");
    return;
  }
  // else

  FLOW_LOG_INFO("Client [" << this << "]: Shutting down while connected; delivering the remaining messages "
                "first.");
  Error_code err_code;
  close(&err_code);
  if (err_code)
  {
    FLOW_LOG_WARNING("Client [" << this << "]: Close during shutdown reported error [" << err_code << "] "
                     "[" << err_code.message() << "]; ignoring.");
  }
}

void Client::Impl::dial(util::String_view uri, Error_code* err_code)
{
  using transport::Asio_socket_sink;
  using transport::Chunk_encoder;
  using transport::Compressor_pools;
  using transport::parse_dial_uri;
  using util::Worker_ctl;
  using flow::async::Single_thread_task_loop;
  using flow::util::ostream_op_string;
  using boost::movelib::make_unique;

  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { dial(uri, actual_err_code); },
         err_code, "Client::dial()"))
  {
    return;
  }
  // else

  if (m_connected)
  {
    FLOW_LOG_WARNING("Client [" << this << "]: Asked to dial [" << uri << "] but already connected.");
    *err_code = error::Code::S_ALREADY_CONNECTED;
    return;
  }
  // else

  FLOW_LOG_INFO("Client [" << this << "]: Dialing [" << uri << "].");

  const auto target = parse_dial_uri(get_logger(), uri, err_code);
  if (*err_code)
  {
    return; // Logged.
  }
  // else

  auto sink = make_unique<Asio_socket_sink>(get_logger(), ostream_op_string(target), target.m_protocol,
                                            target.m_host, target.m_port, err_code);
  if (*err_code)
  {
    return; // Logged.
  }
  // else

  Client_config config;
  {
    Lock lock(m_config_mutex);
    if (target.m_compression)
    {
      m_config.m_compression = *target.m_compression;
    }
    config = m_config;
  }

  // Frame size was validated in ctor, so this cannot fail (if it did, we'd throw, as it would be a bug).
  m_encoder = make_unique<Chunk_encoder>(get_logger(), ostream_op_string(target, "-chunker"),
                                         sink.get(), config.m_frame_size);
  m_sink = std::move(sink);
  m_compressor_pools = make_unique<Compressor_pools>(get_logger(), m_encoder.get());

  m_intake_ctl = make_unique<Worker_ctl>(get_logger(), ostream_op_string(target, "-intake"),
                                         [this]() { m_intake->interrupt(); });
  m_dispatch_ctl = make_unique<Worker_ctl>(get_logger(), ostream_op_string(target, "-dispatch"),
                                           [this]() { m_queue.wake(); });
  m_intake_worker = make_unique<Single_thread_task_loop>(get_logger(), "gelf_intake");
  m_dispatch_worker = make_unique<Single_thread_task_loop>(get_logger(), "gelf_dispatch");

  m_connected = true;

  // Start from the tail of the pipeline: it's ready for messages before they can flow into it.
  const auto compression = config.m_compression;
  m_dispatch_worker->start();
  m_dispatch_worker->post([this, compression]() { dispatch_loop(compression); });
  m_intake_worker->start();
  m_intake_worker->post([this]() { intake_loop(); });

  FLOW_LOG_INFO("Client [" << this << "]: Connected to [" << target << "] (socket [" << *m_sink << "]); "
                "effective config [" << config << "]; delivery started.");
  err_code->clear();
} // Client::Impl::dial()

void Client::Impl::queue_msg(const Message::Ptr& msg, Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { queue_msg(msg, actual_err_code); },
         err_code, "Client::queue_msg()"))
  {
    return;
  }
  // else

  if (!msg)
  {
    FLOW_LOG_WARNING("Client [" << this << "]: Asked to queue null message.");
    *err_code = error::Code::S_INVALID_ARGUMENT;
    return;
  }
  // else

  if (!msg->timestamp())
  {
    msg->set_timestamp(Message::Clock::now());
  }

  FLOW_LOG_TRACE("Client [" << this << "]: Queuing message [" << *msg << "].");

  m_intake->send(Message::Const_ptr(msg)); // Blocks if full.
  err_code->clear();
}

void Client::Impl::close(Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { close(actual_err_code); },
         err_code, "Client::close()"))
  {
    return;
  }
  // else

  if (!m_connected)
  {
    FLOW_LOG_INFO("Client [" << this << "]: Close requested but not connected; nothing to do.");
    err_code->clear();
    return;
  }
  // else

  FLOW_LOG_INFO("Client [" << this << "]: Closing: draining [" << m_intake->size() << "] intake and "
                "[" << m_queue.size() << "] queued messages.");

  // Order matters: once intake is stopped, nothing more can enter m_queue; only then can the dispatcher be done.
  m_intake_ctl->drain_and_stop();
  m_intake_worker->stop(); // Joins thread I (which has returned from intake_loop() by now).
  m_dispatch_ctl->drain_and_stop();
  m_dispatch_worker->stop(); // Ditto for thread D.

  FLOW_LOG_INFO("Client [" << this << "]: Workers stopped after [" << m_intake_ctl->continue_reply_count() << "] "
                "intake and [" << m_dispatch_ctl->continue_reply_count() << "] dispatcher not-yet replies.  "
                "Messages sent so far [" << m_n_sent_msgs << "], dropped so far [" << m_n_dropped_msgs << "].");

  m_sink->close(err_code); // Logs on error.

  // Whatever close() yielded, we are no longer connected.  Destroy in reverse dependency order.
  m_intake_worker.reset();
  m_dispatch_worker.reset();
  m_intake_ctl.reset();
  m_dispatch_ctl.reset();
  m_compressor_pools.reset();
  m_encoder.reset();
  m_sink.reset();
  m_connected = false;

  FLOW_LOG_INFO("Client [" << this << "]: Closed.");
} // Client::Impl::close()

void Client::Impl::intake_loop()
{
  FLOW_LOG_INFO("Client [" << this << "]: Intake worker started.");

  while (!m_intake_ctl->process_request([&]() -> bool { return m_intake->size() != 0; }))
  {
    Message::Const_ptr msg;
    if (m_intake->receive(&msg)) // Blocks until message or interrupt().
    {
      m_queue.push_back(std::move(msg));
    }
    // else { Interrupted: a stop request is pending.  Loop around to handle it. }
  }

  FLOW_LOG_INFO("Client [" << this << "]: Intake worker stopping: intake channel empty.");
}

void Client::Impl::dispatch_loop(transport::Compression compression)
{
  FLOW_LOG_INFO("Client [" << this << "]: Dispatcher started; compression [" << compression << "].");

  util::Fine_duration idle_interval;
  bool fill_gelf_defaults;
  {
    Lock lock(m_config_mutex);
    idle_interval = m_config.m_idle_interval;
    fill_gelf_defaults = m_config.m_fill_gelf_defaults;
  }

  while (true)
  {
    Message::Const_ptr msg;
    if (m_queue.pop_front(&msg))
    {
      dispatch(msg, compression, fill_gelf_defaults);
      continue;
    }
    // else: Nothing to send.  Wait a bit; a new message or a stop request (via wake()) cuts it short.

    if (m_queue.wait_pop_front(&msg, idle_interval))
    {
      dispatch(msg, compression, fill_gelf_defaults);
      continue;
    }
    // else

    if (m_dispatch_ctl->process_request([&]() -> bool { return m_queue.size() != 0; }))
    {
      break;
    }
  } // while (true)

  FLOW_LOG_INFO("Client [" << this << "]: Dispatcher stopping: backing queue empty.");
} // Client::Impl::dispatch_loop()

void Client::Impl::dispatch(const Message::Const_ptr& msg, transport::Compression compression,
                            bool fill_gelf_defaults)
{
  Error_code err_code;
  const auto json_str = serialize_message(get_logger(), *msg, m_hostname, fill_gelf_defaults,
                                          &err_code);
  if (!err_code)
  {
    m_compressor_pools->write_msg(util::to_blob(json_str), compression, &err_code);
  }

  if (err_code)
  {
    ++m_n_dropped_msgs;
    FLOW_LOG_WARNING("Client [" << this << "]: Dropping message [" << *msg << "] due to error [" << err_code << "] "
                     "[" << err_code.message() << "]; total dropped [" << m_n_dropped_msgs << "].");

    Dispatch_error_handler on_error_func;
    {
      Lock lock(m_handler_mutex);
      on_error_func = m_on_dispatch_error_func;
    }
    if (on_error_func)
    {
      on_error_func(err_code, *msg);
    }
    return;
  }
  // else

  ++m_n_sent_msgs;
  FLOW_LOG_TRACE("Client [" << this << "]: Sent message of serialized size [" << json_str.size() << "]; "
                 "total sent [" << m_n_sent_msgs << "].");
} // Client::Impl::dispatch()

void Client::Impl::set_dispatch_error_handler(Dispatch_error_handler&& handler)
{
  Lock lock(m_handler_mutex);
  m_on_dispatch_error_func = std::move(handler);
}

bool Client::Impl::connected() const
{
  return m_connected;
}

Client_config Client::Impl::config() const
{
  Lock lock(m_config_mutex);
  return m_config;
}

const std::string& Client::Impl::hostname() const
{
  return m_hostname;
}

size_t Client::Impl::sent_msg_count() const
{
  return m_n_sent_msgs;
}

size_t Client::Impl::dropped_msg_count() const
{
  return m_n_dropped_msgs;
}

size_t Client::Impl::pending_msg_count() const
{
  return m_intake->size() + m_queue.size();
}

} // namespace gelf
