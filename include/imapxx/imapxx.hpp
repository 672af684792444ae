#pragma once

#include <imapxx/codec/base64.hpp>

#include <imapxx/detail/log.hpp>
#include <imapxx/detail/result.hpp>
#include <imapxx/detail/sasl.hpp>

#include <imapxx/imap/types.hpp>
#include <imapxx/imap/utf7.hpp>
#include <imapxx/imap/tokenizer.hpp>
#include <imapxx/imap/parser.hpp>
#include <imapxx/imap/command.hpp>
#include <imapxx/imap/search.hpp>
#include <imapxx/imap/fetch.hpp>
#include <imapxx/imap/pipeline.hpp>
#include <imapxx/imap/session_state.hpp>
#include <imapxx/imap/dispatcher.hpp>
#include <imapxx/imap/mailbox_tree.hpp>
#include <imapxx/imap/options.hpp>
#include <imapxx/imap/connection.hpp>

#include <imapxx/net/transport.hpp>
#include <imapxx/net/asio_transport.hpp>
