///////////////////////////////////////////////////////////////////////////////
// FILE:          Error.cpp
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

#include "Error.h"


CMCMError::CMCMError(const std::string& msg, Code code) :
   message_(msg),
   code_(code)
{
   fullMsg_ = BuildFullMsg();
}


CMCMError::CMCMError(const std::string& msg, Code code,
      const CMCMError& underlyingError) :
   message_(msg),
   code_(code),
   underlying_(new CMCMError(underlyingError))
{
   fullMsg_ = BuildFullMsg();
}


CMCMError::CMCMError(const CMCMError& other) :
   std::exception(other),
   message_(other.message_),
   code_(other.code_),
   underlying_(other.underlying_ ? new CMCMError(*other.underlying_) : 0),
   fullMsg_(other.fullMsg_)
{
}


CMCMError&
CMCMError::operator=(const CMCMError& rhs)
{
   if (this == &rhs)
      return *this;
   message_ = rhs.message_;
   code_ = rhs.code_;
   underlying_.reset(rhs.underlying_ ? new CMCMError(*rhs.underlying_) : 0);
   fullMsg_ = rhs.fullMsg_;
   return *this;
}


CMCMError::Code
CMCMError::getSpecificCode() const
{
   for (const CMCMError* e = this; e; e = e->getUnderlyingError())
   {
      if (e->getCode() != MCMERR_GENERIC && e->getCode() != MCMERR_OK)
         return e->getCode();
   }
   return MCMERR_GENERIC;
}


std::string
CMCMError::BuildFullMsg() const
{
   std::string msg = message_.empty() ? "(No message)" : message_;
   if (underlying_)
      msg += " [ " + underlying_->getFullMsg() + " ]";
   return msg;
}
