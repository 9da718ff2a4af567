#ifndef SPVD_WALLY_WRAPPER_H
#define SPVD_WALLY_WRAPPER_H
#pragma once

#include <wally_bip32.h>
#include <wally_core.h>
#include <wally_crypto.h>
#include <wally_script.h>
#include <wally_transaction.h>

#endif
