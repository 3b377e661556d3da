//  funPlatform.hpp
//  IranCal
//
#ifndef funPlatform_hpp
#define funPlatform_hpp

int mkdir_p(const char *path, unsigned int mode);

#endif /* funPlatform_hpp */
