///////////////////////////////////////////////////////////////////////////////
// FILE:          Error.h
// PROJECT:       MCMControl
// SUBSYSTEM:     MCMCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Exception class for core errors
//
// LICENSE:       This file is distributed under the "Lesser GPL" (LGPL) license.
//                License text is included with the source distribution.
//
//                This file is distributed in the hope that it will be useful,
//                but WITHOUT ANY WARRANTY; without even the implied warranty
//                of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//
//                IN NO EVENT SHALL THE COPYRIGHT OWNER OR
//                CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT,
//                INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES.

#pragma once

#include "ErrorCodes.h"

#include <exception>
#include <memory>
#include <string>


/// Core error class. Exceptions thrown by the core public API are of this type.
/**
 * Every error carries a message and a code from ErrorCodes.h; the code is the
 * stable way for callers to distinguish, e.g., a limit violation from a
 * protocol desync. An error may also carry the lower-level error that caused
 * it (for example a serial I/O failure underneath a failed position read).
 */
class CMCMError : public std::exception
{
public:
   typedef int Code;

   /// Construct with a message and an optional error code.
   CMCMError(const std::string& msg, Code code = MCMERR_GENERIC);

   /// Construct with a message, an error code, and an underlying error.
   CMCMError(const std::string& msg, Code code,
         const CMCMError& underlyingError);

   CMCMError(const CMCMError& other);
   CMCMError& operator=(const CMCMError& rhs);

   virtual ~CMCMError() {}

   /// Implements std::exception interface. Returns getFullMsg().
   virtual const char* what() const noexcept { return fullMsg_.c_str(); }

   /// Get the message for this error only (no underlying errors).
   virtual std::string getMsg() const { return message_; }

   /// Get a message containing the messages of all chained errors.
   virtual std::string getFullMsg() const { return fullMsg_; }

   /// Get the error code for this error.
   virtual Code getCode() const { return code_; }

   /// Get the first non-generic code in the chain, starting at this error.
   virtual Code getSpecificCode() const;

   /// Access the underlying error; null if there is none.
   virtual const CMCMError* getUnderlyingError() const
   { return underlying_.get(); }

private:
   std::string BuildFullMsg() const;

   std::string message_;
   Code code_;
   std::unique_ptr<CMCMError> underlying_;
   std::string fullMsg_;
};
