/*
 Copyright (C) 2026 JMI Developers
 All rights reserved.

 This file is part of JMI, a free-software/open-source library
 for market-implied rate and credit analytics.

 JMI is free software: you can redistribute it and/or modify it
 under the terms of the Modified BSD License.  You should have received a
 copy of the license along with this program.

 This program is distributed on the basis that it will form a useful
 contribution to risk analytics and model standardisation, but WITHOUT
 ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
 FITNESS FOR A PARTICULAR PURPOSE. See the license for more details.
*/

/*! \file jmid/configuration/meetingcalendar.hpp
    \brief Policy meeting calendar
    \ingroup configuration
*/

#pragma once

#include <jmid/utilities/xmlutils.hpp>

#include <ql/time/date.hpp>

namespace jmi {
namespace data {

/*! Serializable calendar of scheduled policy decision dates

    \code{.xml}
    <MeetingCalendar>
      <Meeting>2026-01-23</Meeting>
      <Meeting>2026-03-19</Meeting>
    </MeetingCalendar>
    \endcode
    \ingroup configuration
*/
class MeetingCalendar : public XMLSerializable {
public:
    MeetingCalendar() {}
    explicit MeetingCalendar(const std::vector<QuantLib::Date>& dates);

    //! \name XMLSerializable interface
    //@{
    void fromXML(const XMLNode& node) override;
    XMLNode toXML() const override;
    //@}

    //! Sorted and unique meeting dates
    const std::vector<QuantLib::Date>& dates() const { return dates_; }

    //! The first meeting on or after \p asof, a null date if there is none
    QuantLib::Date nextMeeting(const QuantLib::Date& asof) const;

private:
    std::vector<QuantLib::Date> dates_;
};

} // namespace data
} // namespace jmi
