#include <iostream>
#include <memory>
#include <thread>
#include "RwLock.hpp"

int main()
{
  auto counter = std::make_shared<fair::RwLock<int>>(0);

  std::thread writer([counter](){
    for(int i = 0; i < 1000; ++i)
    {
      *counter->write() += 1;
    }
  });

  for(int i = 0; i < 1000; ++i)
  {
    std::cout << "read " << *counter->read() << std::endl;
  }

  writer.join();

  auto value = *counter->read();
  std::cout << "final " << value << std::endl;
  return value == 1000 ? 0 : 1;
}
