#pragma once

#include <batchdl/http/http-types.hxx>
#include <batchdl/http/http-request.hxx>
#include <batchdl/http/http-response.hxx>
#include <batchdl/http/http-client.hxx>
#include <batchdl/http/http-json.hxx>
