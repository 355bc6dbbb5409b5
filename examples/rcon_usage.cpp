lsamp::client c("127.0.0.1", 7777, "changeme");

try {
  std::cout << c.rcon("varlist") << std::endl;
}
catch (lsamp::rcon::missing_password &e) {
  std::cerr << "You didn't specify a RCON password." << std::endl;
}
catch (lsamp::rcon::rcon_disabled &e) {
  std::cerr << "RCON is disabled." << std::endl;
}
catch (lsamp::rcon::bad_password &e) {
  std::cerr << "Invalid RCON password." << std::endl;
}
catch (lsamp::rcon::error &e) {
  std::cerr << "Error: " << e.what() << std::endl;
}
