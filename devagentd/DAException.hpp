//
//  DAException.hpp
//  devagentd
//
//  Created on 17.10.26.
//

#ifndef DAException_hpp
#define DAException_hpp

#include <libgeneral/exception.hpp>

namespace tihmstar {

class DAException : public tihmstar::exception {
public:
    using tihmstar::exception::exception;
};

#pragma mark custom catch exceptions
class DAException_not_found : public DAException{
    using DAException::DAException;
};

class DAException_launch_failed : public DAException{
    using DAException::DAException;
};

class DAException_bad_config : public DAException{
    using DAException::DAException;
};

};

#endif /* DAException_hpp */
