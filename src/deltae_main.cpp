#include <iostream>
#include <string>
#include <unistd.h>

#include "deltae.hh"

using namespace deltae;

static void usage(const char* argv0)
{
  std::cerr << "usage: " << argv0
            << " [-m METHOD] [-t lab|lch|xyz|rgb] [-p PRECISION] COLOR0 COLOR1\n"
            << "  METHOD: de2000 (default), de1976, de1994, de1994t, cmc1, cmc2\n"
            << "  COLOR:  comma separated values, e.g. \"89.73, 1.88, -6.96\"\n";
}

static DeltaE compare(const std::string& color_type,
                      const std::string& color0,
                      const std::string& color1,
                      const DEMethod& method)
{
  if (color_type == "lab")
    return delta(parseLab(color0), parseLab(color1), method);
  if (color_type == "lch")
    return delta(parseLch(color0), parseLch(color1), method);
  if (color_type == "xyz")
    return delta(parseXyz(color0), parseXyz(color1), method);
  if (color_type == "rgb")
    return delta(parseRgb(color0), parseRgb(color1), method);
  throw InvalidInput("unknown color type: '" + color_type + "'");
}

int main(int argc, char** argv)
{
  std::string method_name = "de2000";
  std::string color_type = "lab";
  precision_t precision;

  int c;
  while ((c = getopt(argc, argv, "m:t:p:h")) != -1)
    {
      switch (c)
        {
        case 'm':
          method_name = optarg;
          break;
        case 't':
          color_type = optarg;
          break;
        case 'p':
          try
            {
              precision = parsePrecision(optarg);
            }
          catch (const ValueError& err)
            {
              std::cerr << "error: bad precision, " << err.what() << std::endl;
              usage(argv[0]);
              return 1;
            }
          break;
        case 'h':
        default:
          usage(argv[0]);
          return 1;
        }
    }

  if (argc - optind != 2)
    {
      usage(argv[0]);
      return 1;
    }

  try
    {
      DEMethod method = parseMethod(method_name);
      DeltaE result = compare(color_type, argv[optind], argv[optind + 1], method);
      std::cout << toString(result, precision) << std::endl;
    }
  catch (const ValueError& err)
    {
      std::cerr << "error: " << err.what() << std::endl;
      return 1;
    }
  catch (const InvalidInput& err)
    {
      std::cerr << "error: " << err.what() << std::endl;
      return 1;
    }

  return 0;
}
