#pragma once

#include <xoauthxx/config.hpp>

#include <xoauthxx/codec/base64.hpp>
#include <xoauthxx/codec/percent.hpp>

#include <xoauthxx/detail/log.hpp>
#include <xoauthxx/detail/result.hpp>
#include <xoauthxx/detail/sasl.hpp>

#include <xoauthxx/http/transport.hpp>
#include <xoauthxx/http/curl_transport.hpp>
#include <xoauthxx/http/asio_transport.hpp>

#include <xoauthxx/oauth2/client_params.hpp>
#include <xoauthxx/oauth2/token.hpp>
#include <xoauthxx/oauth2/token_endpoint.hpp>

#include <xoauthxx/source/identity.hpp>
#include <xoauthxx/source/credential_source.hpp>

#include <xoauthxx/auth_record.hpp>
#include <xoauthxx/resolver.hpp>
#include <xoauthxx/config_file.hpp>

// Protocol adapters
#include <xoauthxx/imap/authenticator.hpp>
#include <xoauthxx/smtp/authenticator.hpp>

#if XOAUTHXX_THROWING_ENABLED
#include <xoauthxx/throwing.hpp>
#endif
